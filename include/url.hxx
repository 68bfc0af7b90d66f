#pragma once

#include <http.hxx>

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

namespace http
{
    inline bool ParseUrl(HttpLocation &dst, const std::string_view &src)
    {
        const auto scheme_end = src.find("://");
        if (scheme_end == std::string_view::npos)
            return false;

        const auto scheme = src.substr(0, scheme_end);
        if (scheme != "https" && scheme != "http")
            return false;

        dst.UseTLS = scheme == "https";

        const auto host_begin = scheme_end + 3;
        const auto path_begin = src.find('/', host_begin);

        auto host_port = path_begin == std::string_view::npos
                             ? src.substr(host_begin)
                             : src.substr(host_begin, path_begin - host_begin);

        dst.Pathname = path_begin == std::string_view::npos
                           ? "/"
                           : src.substr(path_begin);

        if (const auto colon = host_port.find(':'); colon != std::string_view::npos)
        {
            const auto port = host_port.substr(colon + 1);

            std::uint16_t value{};
            if (const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
                ec != std::errc() || ptr != port.data() + port.size())
                return false;

            dst.Host = host_port.substr(0, colon);
            dst.Port = value;
        }
        else
        {
            dst.Host = host_port;
            dst.Port = dst.UseTLS ? 443 : 80;
        }

        return !dst.Host.empty();
    }
}
