// main.cpp
#include <atomic>
#include <csignal> // For SIGINT
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <boost/program_options.hpp> // For command line parsing

// Our project includes
#include "discord_transport.hpp"
#include "errors.hpp"
#include "file_store.hpp"
#include "settings.hpp"
#include "store_config.hpp"

namespace fs = std::filesystem;
namespace po = boost::program_options;

using namespace ChannelStore;

namespace
{

    std::atomic<bool> g_abort(false);

    void onInterrupt(int)
    {
        g_abort = true;
    }

    const char *const USAGE =
        "Usage: channel_store <command> [arguments] [options]\n"
        "\n"
        "Commands:\n"
        "  config [--global] [key [value]]   Show or set token/channel\n"
        "  disassemble <file>                Split a file into local part files\n"
        "  assemble <name> [parts dir]       Rebuild a file from local part files\n"
        "  upload <file>                     Store a file in the channel\n"
        "  download <root>                   Fetch a stored file by its root reference\n"
        "  list                              List the files stored in the channel\n";

    // 1536 -> "1.50 KiB"
    std::string humanBytes(std::uint64_t bytes)
    {
        static const char *const units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
        double value = static_cast<double>(bytes);
        std::size_t unit = 0;
        while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0]))
        {
            value /= 1024.0;
            ++unit;
        }
        std::ostringstream out;
        if (unit == 0)
        {
            out << bytes << " B";
        }
        else
        {
            out << std::fixed << std::setprecision(2) << value << " " << units[unit];
        }
        return out.str();
    }

    void printProgress(const Transfer::ProgressEvent &event)
    {
        switch (event.stage)
        {
        case Transfer::ProgressStage::ChunkPublished:
            std::cout << "Chunk " << event.completed << " of " << event.total << " published" << std::endl;
            break;
        case Transfer::ProgressStage::ChunkFetched:
            std::cout << "Chunk " << event.completed << " of " << event.total << " fetched" << std::endl;
            break;
        case Transfer::ProgressStage::ManifestPublished:
            std::cout << "Manifest published" << std::endl;
            break;
        case Transfer::ProgressStage::ManifestFetched:
            std::cout << "Manifest fetched: " << event.total << " chunks" << std::endl;
            break;
        case Transfer::ProgressStage::Verified:
            std::cout << "Integrity verified: " << humanBytes(event.bytes) << std::endl;
            break;
        }
    }

    std::string argAt(const std::vector<std::string> &args, std::size_t i, const char *what)
    {
        if (i >= args.size())
        {
            throw ConfigError(std::string("Missing argument: ") + what + ".");
        }
        return args[i];
    }

    std::optional<std::string> optionalString(const po::variables_map &vm, const char *name)
    {
        if (vm.count(name))
        {
            return vm[name].as<std::string>();
        }
        return std::nullopt;
    }

    Config::TransferSettings transferSettings(const po::variables_map &vm)
    {
        Config::TransferSettings settings;
        settings.chunk_size = vm["chunk-size"].as<std::size_t>();
        settings.concurrency = vm["concurrency"].as<std::size_t>();
        settings.validate();
        return settings;
    }

    FileStore connect(const po::variables_map &vm, const Config::SettingsFile &settings_file)
    {
        Config::Credentials credentials = settings_file.resolve(fs::current_path(),
                                                                optionalString(vm, "token"),
                                                                optionalString(vm, "channel"));
        return FileStore::connect(credentials, transferSettings(vm));
    }

    int runConfig(const std::vector<std::string> &args, const po::variables_map &vm, Config::SettingsFile &settings_file)
    {
        const bool global = vm.count("global") > 0;
        const std::optional<fs::path> scope = global ? std::nullopt : std::optional<fs::path>(fs::current_path());

        if (args.empty())
        {
            for (Config::SettingKey key : {Config::SettingKey::Token, Config::SettingKey::Channel})
            {
                std::optional<std::string> value =
                    global ? settings_file.get(key) : settings_file.lookup(key, fs::current_path());
                std::cout << Config::settingKeyName(key) << " = " << (value ? *value : "<not set>") << std::endl;
            }
            std::cout << "Settings file: " << settings_file.path().string() << std::endl;
            return 0;
        }

        Config::SettingKey key = Config::parseSettingKey(args[0]);
        if (args.size() == 1)
        {
            std::optional<std::string> value =
                global ? settings_file.get(key) : settings_file.lookup(key, fs::current_path());
            if (!value)
            {
                throw ConfigError(std::string("No ") + Config::settingKeyName(key) + " set.");
            }
            std::cout << *value << std::endl;
            return 0;
        }

        settings_file.set(key, args[1], scope);
        std::cout << "Set " << Config::settingKeyName(key) << (global ? " globally" : " for " + fs::current_path().string())
                  << std::endl;
        return 0;
    }

    int runDisassemble(const std::vector<std::string> &args, const po::variables_map &vm)
    {
        fs::path file = argAt(args, 0, "file");
        fs::path out_dir = vm.count("output") ? fs::path(vm["output"].as<std::string>()) : fs::current_path();
        std::size_t chunk_size = vm["chunk-size"].as<std::size_t>();
        if (chunk_size == 0)
        {
            chunk_size = Transport::DiscordTransport::defaultLimits().defaultChunkSize();
        }
        FileStore::disassemble(file, out_dir, chunk_size);
        return 0;
    }

    int runAssemble(const std::vector<std::string> &args, const po::variables_map &vm)
    {
        std::string name = argAt(args, 0, "file name");
        fs::path parts_dir = args.size() > 1 ? fs::path(args[1]) : fs::current_path();
        std::optional<fs::path> output;
        if (vm.count("output"))
        {
            output = fs::path(vm["output"].as<std::string>());
        }
        FileStore::assemble(name, parts_dir, output);
        return 0;
    }

    int runUpload(const std::vector<std::string> &args, const po::variables_map &vm, const Config::SettingsFile &settings_file)
    {
        fs::path file = argAt(args, 0, "file");
        FileStore store = connect(vm, settings_file);
        Transfer::UploadResult result = store.uploadFile(file, "", printProgress, &g_abort);
        std::cout << "Uploaded " << result.manifest.chunks.size() << " parts to channel id " << store.channel()
                  << ". Root reference: " << result.root << std::endl;
        return 0;
    }

    int runDownload(const std::vector<std::string> &args, const po::variables_map &vm, const Config::SettingsFile &settings_file)
    {
        RootReference root(argAt(args, 0, "root reference"));
        fs::path destination = vm.count("output") ? fs::path(vm["output"].as<std::string>()) : fs::path();
        FileStore store = connect(vm, settings_file);
        Transfer::DownloadResult result = store.retrieveFile(root, destination, printProgress, &g_abort);
        std::cout << "Downloaded " << result.manifest.file_name << " (" << humanBytes(result.bytes) << ") to "
                  << result.path.string() << std::endl;
        return 0;
    }

    int runList(const po::variables_map &vm, const Config::SettingsFile &settings_file)
    {
        FileStore store = connect(vm, settings_file);
        std::optional<MessageId> cursor;
        if (vm.count("cursor"))
        {
            cursor = MessageId(vm["cursor"].as<std::string>());
        }
        const std::size_t limit = vm["limit"].as<std::size_t>();

        Catalogue::CatalogueScanner scanner = store.listFiles(cursor);
        std::cout << std::left << std::setw(22) << "ID" << std::setw(40) << "Name" << std::setw(14) << "Size"
                  << "Published" << std::endl;

        std::size_t shown = 0;
        while (limit == 0 || shown < limit)
        {
            std::optional<Catalogue::CatalogueEntry> entry = scanner.next();
            if (!entry)
            {
                break;
            }
            std::cout << std::left << std::setw(22) << entry->root.str() << std::setw(40) << entry->file_name
                      << std::setw(14) << humanBytes(entry->total_size) << entry->published_at << std::endl;
            ++shown;
        }

        if (limit != 0 && shown == limit && scanner.cursor())
        {
            std::cout << "More files may follow: --cursor " << scanner.cursor()->str() << std::endl;
        }
        return 0;
    }

} // namespace

int main(int argc, char *argv[])
{
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show this help")
        ("config-directory", po::value<std::string>(), "Base directory for the settings file")
        ("token", po::value<std::string>(), "Bot token, overrides the settings file")
        ("channel", po::value<std::string>(), "Channel id, overrides the settings file")
        ("chunk-size", po::value<std::size_t>()->default_value(0), "Chunk size in bytes (0: largest the backend allows)")
        ("concurrency", po::value<std::size_t>()->default_value(Config::StoreConfig::DEFAULT_CONCURRENCY), "Parallel transfers")
        ("output,o", po::value<std::string>(), "Output file or directory")
        ("limit", po::value<std::size_t>()->default_value(0), "Stop listing after this many files (0: all)")
        ("cursor", po::value<std::string>(), "Resume a listing after this message id")
        ("global", "Apply `config` to the global section");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>(), "")
        ("args", po::value<std::vector<std::string>>()->default_value(std::vector<std::string>(), ""), "");

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    }
    catch (const po::error &e)
    {
        std::cerr << "Error: " << e.what() << "\n\n"
                  << USAGE << "\n"
                  << desc << std::endl;
        return 1;
    }

    if (vm.count("help") || !vm.count("command"))
    {
        std::cout << USAGE << "\n"
                  << desc << std::endl;
        return vm.count("help") ? 0 : 1;
    }

    std::signal(SIGINT, onInterrupt);

    const std::string command = vm["command"].as<std::string>();
    const std::vector<std::string> args = vm["args"].as<std::vector<std::string>>();

    try
    {
        std::optional<fs::path> base;
        if (vm.count("config-directory"))
        {
            base = fs::path(vm["config-directory"].as<std::string>());
        }

        if (command == "disassemble")
        {
            return runDisassemble(args, vm);
        }
        if (command == "assemble")
        {
            return runAssemble(args, vm);
        }

        Config::SettingsFile settings_file = Config::SettingsFile::open(base);
        if (command == "config")
        {
            return runConfig(args, vm, settings_file);
        }
        if (command == "upload")
        {
            return runUpload(args, vm, settings_file);
        }
        if (command == "download")
        {
            return runDownload(args, vm, settings_file);
        }
        if (command == "list")
        {
            return runList(vm, settings_file);
        }

        std::cerr << "Unknown command: " << command << "\n\n"
                  << USAGE << std::endl;
        return 1;
    }
    catch (const StoreError &e)
    {
        std::cerr << "Error [" << errorKindName(e.kind()) << "]: " << describeError(e.kind()) << std::endl;
        std::cerr << "  " << e.what() << std::endl;
        return exitCodeFor(e.kind());
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
