// include/quant_ngin/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "quant_ngin/core/error.hpp"

namespace quant_ngin {

/**
 * @brief Base class for all configuration types
 * Provides common JSON serialization and file persistence
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to JSON file
     * @param filepath Path to save the file
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to the file
     * @return Result indicating success or failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief Convert configuration to JSON
     */
    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON
     * Keys that are absent keep their current value.
     */
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Check value ranges after loading
     * load_from_file() fails with this error when the loaded values are invalid.
     */
    virtual Result<void> validate() const {
        return Result<void>();
    }
};

}  // namespace quant_ngin
