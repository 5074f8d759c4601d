#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "dashwire/transport/error.hpp"


namespace dashwire::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure{false};   // true = wss, false = ws
        std::string host;
        std::string port;
        std::string path;
    };


    // ---------------------------------------------------------------------
    // Minimal URL parser supporting ws:// and wss://
    // Accepts common dashboard endpoint URLs and rejects malformed inputs
    // without attempting full RFC compliance.
    //
    // Example inputs:
    //   ws://localhost:3001/
    //   wss://dashboard.example.com/events?token=abc
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(const std::string& url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract scheme
        constexpr std::string_view ws  = "ws://";
        constexpr std::string_view wss = "wss://";
        size_t pos = 0;
        if (url.compare(0, ws.size(), ws) == 0) {
            out.secure = false;
            pos = ws.size();
        }
        else if (url.compare(0, wss.size(), wss) == 0) {
            out.secure = true;
            pos = wss.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // 2) Extract host[:port], the path starts at '/' or '?'
        size_t slash = url.find_first_of("/?", pos);
        std::string hostport = (slash == std::string::npos) ? url.substr(pos) : url.substr(pos, slash - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        // 3) Split host and port
        size_t colon = hostport.rfind(':');
        if (colon != std::string::npos) {
            out.host = hostport.substr(0, colon);
            out.port = hostport.substr(colon + 1);
        } else {
            out.host = hostport;
            out.port = (out.secure) ? "443" : "80";
        }
        // 4) Path (default "/" if missing)
        if (slash == std::string::npos) {
            out.path = "/";
        } else if (url[slash] == '?') {
            out.path = "/" + url.substr(slash);
        } else {
            out.path = url.substr(slash);
        }

        // Invariants check --------------------------------

        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace dashwire::transport
