#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>        // for int32_t
#include <string>         // for string
#include <string_view>    // for string_view, hash
#include <unordered_map>  // for unordered_map
#include <variant>        // for variant
#include <vector>         // for vector

// Runtime settings: built-in defaults, overridden by LVMVIEW_* environment variables.
//
//   REFRESH_INTERVAL  seconds between inventory refreshes   (LVMVIEW_REFRESH_INTERVAL)
//   COMMAND_TIMEOUT   milliseconds per inventory command    (LVMVIEW_COMMAND_TIMEOUT)
//   LOG_FILE          spdlog file sink path                 (LVMVIEW_LOG_FILE)
class Config final {
 public:
    using value_type      = std::unordered_map<std::string_view, std::variant<std::string, std::int32_t>>;
    using reference       = value_type&;
    using const_reference = const value_type&;

    Config() noexcept          = default;
    virtual ~Config() noexcept = default;

    static bool initialize() noexcept;
    static Config* instance();

    /// @brief Applies environment overrides on top of the current values.
    /// Invalid or zero values are rejected and keep the previous value.
    void apply_environment() noexcept;

    /* clang-format off */

    // Element access.
    auto data() noexcept -> reference
    { return m_data; }
    auto data() const noexcept -> const_reference
    { return m_data; }

    // Overrides rejected by apply_environment, e.g. "LVMVIEW_REFRESH_INTERVAL=abc".
    auto rejected_overrides() const noexcept -> const std::vector<std::string>&
    { return m_rejected; }

    /* clang-format on */

    /// Fills `data` with the built-in defaults.
    static void set_defaults(reference data) noexcept;

 private:
    value_type m_data{};
    std::vector<std::string> m_rejected{};
};

#endif  // CONFIG_HPP
