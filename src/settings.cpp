// src/settings.cpp
#include "settings.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

#include "errors.hpp"
#include "store_config.hpp"

namespace fs = std::filesystem;

namespace ChannelStore
{
    namespace Config
    {

        namespace
        {
            const char *const GLOBAL_SECTION = "global";
            const char *const DIRECTORIES_SECTION = "directories";

            const nlohmann::json *findSection(const nlohmann::json &data, const std::optional<std::string> &scope)
            {
                if (!scope)
                {
                    auto it = data.find(GLOBAL_SECTION);
                    return (it != data.end() && it->is_object()) ? &*it : nullptr;
                }
                auto dirs = data.find(DIRECTORIES_SECTION);
                if (dirs == data.end() || !dirs->is_object())
                {
                    return nullptr;
                }
                auto it = dirs->find(*scope);
                return (it != dirs->end() && it->is_object()) ? &*it : nullptr;
            }
        } // namespace

        SettingKey parseSettingKey(const std::string &name)
        {
            if (name == "token")
            {
                return SettingKey::Token;
            }
            if (name == "channel")
            {
                return SettingKey::Channel;
            }
            throw ConfigError("Invalid key '" + name + "'. Valid keys are: token, channel.");
        }

        const char *settingKeyName(SettingKey key)
        {
            switch (key)
            {
            case SettingKey::Token:
                return "token";
            case SettingKey::Channel:
                return "channel";
            }
            return "unknown";
        }

        SettingsFile::SettingsFile(fs::path path) : path_(std::move(path)), data_(nlohmann::json::object())
        {
            load();
        }

        SettingsFile SettingsFile::open(const std::optional<fs::path> &base)
        {
            return SettingsFile(StoreConfig::getSettingsFilePath(base));
        }

        std::string SettingsFile::scopeKey(const fs::path &scope)
        {
            return fs::absolute(scope).lexically_normal().string();
        }

        void SettingsFile::load()
        {
            if (!fs::exists(path_))
            {
                return;
            }
            std::ifstream ifs(path_);
            if (!ifs.is_open())
            {
                throw ConfigError("Failed to open settings file for reading: " + path_.string());
            }
            try
            {
                ifs >> data_;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw ConfigError("Error parsing settings file " + path_.string() + ": " + e.what());
            }
            if (!data_.is_object())
            {
                throw ConfigError("Settings file " + path_.string() + " does not hold a JSON object.");
            }
        }

        void SettingsFile::save() const
        {
            if (path_.has_parent_path())
            {
                StoreConfig::ensureDirectoryExists(path_.parent_path());
            }
            std::ofstream ofs(path_);
            if (!ofs.is_open())
            {
                throw ConfigError("Failed to open settings file for writing: " + path_.string());
            }
            ofs << data_.dump(4) << std::endl;
            if (!ofs.good())
            {
                throw ConfigError("Failed to write settings file: " + path_.string());
            }
        }

        void SettingsFile::set(SettingKey key, const std::string &value, const std::optional<fs::path> &scope)
        {
            if (value.empty())
            {
                throw ConfigError(std::string("Value for '") + settingKeyName(key) + "' must not be empty.");
            }
            if (key == SettingKey::Channel &&
                !std::all_of(value.begin(), value.end(), [](unsigned char c)
                             { return std::isdigit(c) != 0; }))
            {
                throw ConfigError("Channel must be a numeric channel id, got '" + value + "'.");
            }

            if (scope)
            {
                data_[DIRECTORIES_SECTION][scopeKey(*scope)][settingKeyName(key)] = value;
            }
            else
            {
                data_[GLOBAL_SECTION][settingKeyName(key)] = value;
            }
            save();
        }

        std::optional<std::string> SettingsFile::get(SettingKey key, const std::optional<fs::path> &scope) const
        {
            std::optional<std::string> section_name;
            if (scope)
            {
                section_name = scopeKey(*scope);
            }
            const nlohmann::json *section = findSection(data_, section_name);
            if (section == nullptr)
            {
                return std::nullopt;
            }
            auto it = section->find(settingKeyName(key));
            if (it == section->end() || !it->is_string())
            {
                return std::nullopt;
            }
            return it->get<std::string>();
        }

        std::optional<std::string> SettingsFile::lookup(SettingKey key, const fs::path &cwd) const
        {
            if (std::optional<std::string> local = get(key, cwd))
            {
                return local;
            }
            return get(key);
        }

        Credentials SettingsFile::resolve(const fs::path &cwd,
                                          const std::optional<std::string> &token_override,
                                          const std::optional<std::string> &channel_override) const
        {
            Credentials credentials;

            std::optional<std::string> token = token_override ? token_override : lookup(SettingKey::Token, cwd);
            if (!token || token->empty())
            {
                throw ConfigError("No token set. Run `channel_store config token <token>` or pass --token.");
            }
            credentials.token = *token;

            std::optional<std::string> channel = channel_override ? channel_override : lookup(SettingKey::Channel, cwd);
            if (!channel || channel->empty())
            {
                throw ConfigError("No channel set. Run `channel_store config channel <id>` or pass --channel.");
            }
            credentials.channel = *channel;
            return credentials;
        }

    } // namespace Config
} // namespace ChannelStore
