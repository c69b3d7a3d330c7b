#include "http/http_cookie.h"

namespace zsession::zhttp
{
    std::string Cookie::to_string() const
    {
        std::string out = name + "=" + value;
        if (!path.empty())
        {
            out += "; Path=" + path;
        }
        if (max_age.count() > 0)
        {
            out += "; Max-Age=" + std::to_string(max_age.count());
        }
        if (http_only)
        {
            out += "; HttpOnly";
        }
        if (secure)
        {
            out += "; Secure";
        }
        return out;
    }
} // namespace zsession::zhttp
