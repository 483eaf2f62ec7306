// include/settings.hpp
#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp> // For JSON handling

namespace ChannelStore
{
    namespace Config
    {

        // Everything needed to talk to the backend.
        struct Credentials
        {
            std::string token;
            std::string channel;
        };

        enum class SettingKey
        {
            Token,
            Channel
        };

        // "token" / "channel". Throws ConfigError for anything else.
        SettingKey parseSettingKey(const std::string &name);
        const char *settingKeyName(SettingKey key);

        // settings.json: a "global" section plus one section per directory,
        // keyed by absolute path:
        //   {"global": {"token": "..."}, "directories": {"/home/me/x": {"channel": "..."}}}
        // A directory's value wins over the global one, key by key.
        class SettingsFile
        {
        public:
            explicit SettingsFile(std::filesystem::path path);

            // Settings file under base (or the default config directory).
            static SettingsFile open(const std::optional<std::filesystem::path> &base = std::nullopt);

            const std::filesystem::path &path() const { return path_; }

            // scope empty: global section. Otherwise the directory's section.
            // Writes the file straight away.
            void set(SettingKey key, const std::string &value,
                     const std::optional<std::filesystem::path> &scope = std::nullopt);

            // Value stored in exactly that section, no fallback.
            std::optional<std::string> get(SettingKey key,
                                           const std::optional<std::filesystem::path> &scope = std::nullopt) const;

            // Value for cwd, falling back to the global section.
            std::optional<std::string> lookup(SettingKey key, const std::filesystem::path &cwd) const;

            // Overrides first, then cwd, then global.
            // Throws ConfigError "No token set" / "No channel set".
            Credentials resolve(const std::filesystem::path &cwd,
                                const std::optional<std::string> &token_override = std::nullopt,
                                const std::optional<std::string> &channel_override = std::nullopt) const;

        private:
            void load();
            void save() const;
            static std::string scopeKey(const std::filesystem::path &scope);

            std::filesystem::path path_;
            nlohmann::json data_;
        };

    } // namespace Config
} // namespace ChannelStore
