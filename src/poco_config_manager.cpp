#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    nlohmann::json yamlToJson(const YAML::Node &node)
    {
        switch (node.Type())
        {
        case YAML::NodeType::Map:
        {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto &entry : node)
            {
                obj[entry.first.as<std::string>()] = yamlToJson(entry.second);
            }
            return obj;
        }
        case YAML::NodeType::Sequence:
        {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &item : node)
            {
                arr.push_back(yamlToJson(item));
            }
            return arr;
        }
        case YAML::NodeType::Scalar:
        {
            bool b;
            if (YAML::convert<bool>::decode(node, b))
                return b;
            long long i;
            if (YAML::convert<long long>::decode(node, i))
                return i;
            double d;
            if (YAML::convert<double>::decode(node, d))
                return d;
            return node.as<std::string>();
        }
        default:
            return nullptr;
        }
    }
}

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse " + path + ": " + e.displayText());
        return false;
    }
    return true;
}

bool PocoConfigManager::loadYaml(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
        return false;

    nlohmann::json converted;
    try
    {
        converted = yamlToJson(YAML::LoadFile(path));
    }
    catch (const YAML::Exception &e)
    {
        Logger::error("Failed to parse " + path + ": " + std::string(e.what()));
        return false;
    }

    if (!converted.is_object())
    {
        Logger::error("Ignoring " + path + ": top level is not a mapping");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
    applyLocked("", converted);
    return true;
}

void PocoConfigManager::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyLocked("", patch);
}

void PocoConfigManager::applyLocked(const std::string &prefix, const nlohmann::json &node)
{
    if (node.is_object())
    {
        for (auto it = node.begin(); it != node.end(); ++it)
        {
            std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
            applyLocked(key, it.value());
        }
    }
    else if (!node.is_null())
    {
        if (node.is_boolean())
            cfg_->setBool(prefix, node.get<bool>());
        else if (node.is_number_integer())
            cfg_->setInt(prefix, node.get<int>());
        else if (node.is_number_float())
            cfg_->setDouble(prefix, node.get<double>());
        else if (node.is_string())
            cfg_->setString(prefix, node.get<std::string>());
        else
            cfg_->setString(prefix, node.dump());
    }
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}
