#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Thread-safe wrapper around a Poco JSON configuration tree
 *
 * Keys are dotted paths ("transcode.workers"). JSON files are loaded
 * directly; YAML files are converted to JSON first.
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    bool load(const std::string &path);
    bool loadYaml(const std::string &path);

    // Drop everything loaded so far
    void clear();

    void update(const nlohmann::json &patch);

    // Defaults apply to missing keys
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;

private:
    PocoConfigManager();
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    void applyLocked(const std::string &prefix, const nlohmann::json &node);

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
