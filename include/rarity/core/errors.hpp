#pragma once
#include <cstdint>
#include <type_traits>

namespace rarity::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        Malformed,
        Unbalanced,
        Cancelled,
        Timeout,
        Io,
        Network,
        Unsupported,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Parse,
        Html,
        Extract,
        Cache,
        Codec,
        Net,
        Cli,
        Bindings,
        Config,
    };

    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    // Error kinds surfaced at the request boundary.
    [[nodiscard]] constexpr bool is_parse_failure(Status s) noexcept {
        return s.domain == StatusDomain::Html && s.code == StatusCode::Malformed;
    }

    [[nodiscard]] constexpr bool is_node_not_found(Status s) noexcept {
        return s.domain == StatusDomain::Html && s.code == StatusCode::NotFound;
    }

    [[nodiscard]] constexpr bool is_unbalanced(Status s) noexcept {
        return s.domain == StatusDomain::Extract && s.code == StatusCode::Unbalanced;
    }

    [[nodiscard]] constexpr bool is_fetch_failure(Status s) noexcept {
        return s.domain == StatusDomain::Net && !is_ok(s);
    }

    [[nodiscard]] constexpr bool is_store_failure(Status s) noexcept {
        return s.domain == StatusDomain::Cache && !is_ok(s);
    }

    const char* status_code_name(StatusCode code) noexcept;
    const char* status_domain_name(StatusDomain domain) noexcept;

    // Writes a one-line description ("<kind>: <detail>") into buf, always NUL-terminated.
    // Returns buf for convenience.
    const char* status_describe(Status s, char* buf, u32 buf_len) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace rarity::core
