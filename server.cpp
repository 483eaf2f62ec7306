// server.cpp
#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include <fstream>
#include <memory> // For std::make_shared

// Crow includes
#include <crow.h>
#include <crow/multipart.h> // For multipart/form-data parsing

#include <boost/program_options.hpp> // For command line parsing

// Our project includes
#include "errors.hpp"
#include "file_store.hpp"
#include "settings.hpp"
#include "staged_file.hpp"

namespace fs = std::filesystem;
namespace po = boost::program_options;

using namespace ChannelStore;

namespace {

// HTTP status for each failure kind
int statusFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Config: return 400;
    case ErrorKind::NotFound: return 404;
    case ErrorKind::PayloadTooLarge:
    case ErrorKind::ManifestTooLarge: return 413;
    case ErrorKind::CorruptManifest:
    case ErrorKind::UnsupportedVersion:
    case ErrorKind::Integrity: return 422;
    case ErrorKind::RateLimited: return 429;
    case ErrorKind::Cancelled: return 503;
    case ErrorKind::Transport:
    case ErrorKind::UploadFailed:
    case ErrorKind::DownloadFailed: return 502;
    }
    return 500;
}

crow::response errorResponse(const StoreError& e) {
    crow::json::wvalue body;
    body["error"] = errorKindName(e.kind());
    body["message"] = describeError(e.kind());
    body["detail"] = e.what();
    return crow::response(statusFor(e.kind()), body);
}

crow::json::wvalue entryJson(const Catalogue::CatalogueEntry& entry) {
    crow::json::wvalue j;
    j["root"] = entry.root.str();
    j["fileName"] = entry.file_name;
    j["totalSize"] = entry.total_size;
    j["chunkCount"] = entry.chunk_count;
    j["wholeFileHash"] = entry.whole_file_hash;
    j["publishedAt"] = entry.published_at;
    return j;
}

} // namespace

int main(int argc, char* argv[]) {
    po::options_description desc("channel_store_server options");
    desc.add_options()
        ("help,h", "Show this help")
        ("port", po::value<unsigned short>()->default_value(8080), "Port to listen on")
        ("config-directory", po::value<std::string>(), "Base directory for the settings file")
        ("token", po::value<std::string>(), "Bot token, overrides the settings file")
        ("channel", po::value<std::string>(), "Channel id, overrides the settings file")
        ("concurrency", po::value<std::size_t>()->default_value(Config::StoreConfig::DEFAULT_CONCURRENCY), "Parallel transfers per request");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n" << desc << std::endl;
        return 1;
    }
    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }

    std::shared_ptr<FileStore> store;
    try {
        std::optional<fs::path> base;
        if (vm.count("config-directory")) {
            base = fs::path(vm["config-directory"].as<std::string>());
        }
        std::optional<std::string> token, channel;
        if (vm.count("token")) token = vm["token"].as<std::string>();
        if (vm.count("channel")) channel = vm["channel"].as<std::string>();

        Config::Credentials credentials =
            Config::SettingsFile::open(base).resolve(fs::current_path(), token, channel);
        Config::TransferSettings settings;
        settings.concurrency = vm["concurrency"].as<std::size_t>();
        store = std::make_shared<FileStore>(FileStore::connect(credentials, settings));
    } catch (const StoreError& e) {
        std::cerr << "Error [" << errorKindName(e.kind()) << "]: " << describeError(e.kind()) << "\n  "
                  << e.what() << std::endl;
        return exitCodeFor(e.kind());
    }

    // --- Crow Application Setup ---
    crow::SimpleApp app;

    // --- POST /files: Store a new file ---
    // Expects multipart/form-data with fields:
    // - file: the actual file content
    // - filename: (optional) name to record, if not provided in multipart-data
    CROW_ROUTE(app, "/files").methods("POST"_method)
    ([store](const crow::request& req) {
        if (req.get_header_value("Content-Type").rfind("multipart/form-data", 0) != 0) {
            return crow::response(400, "Bad Request: Expected multipart/form-data.");
        }

        crow::multipart::message multipart_data(req);
        std::string filename_from_form;
        const crow::multipart::part* file_part = nullptr;

        for (const auto& part : multipart_data.parts) {
            const std::string name = part.get_header_object("Content-Disposition").params.count("name")
                ? part.get_header_object("Content-Disposition").params.at("name") : "";
            if (name == "file") {
                file_part = &part;
            } else if (name == "filename") {
                filename_from_form = part.body;
            }
        }

        if (!file_part) {
            return crow::response(400, "Bad Request: 'file' part missing in multipart/form-data.");
        }

        // Name to record: form field, else the part's file name, else generated
        std::string filename_to_use = filename_from_form;
        if (filename_to_use.empty()) {
            const auto& params = file_part->get_header_object("Content-Disposition").params;
            auto it = params.find("filename");
            if (it != params.end()) {
                filename_to_use = fs::path(it->second).filename().string();
            }
        }
        if (filename_to_use.empty()) {
            filename_to_use = "uploaded_file_" + randomSuffix();
        }

        ScratchDirectory scratch;
        fs::path temp_filepath = scratch.path() / "upload.bin";
        std::ofstream temp_ofs(temp_filepath, std::ios::binary);
        if (!temp_ofs.is_open()) {
            return crow::response(500, "Internal Server Error: Could not create temporary file.");
        }
        temp_ofs.write(file_part->body.data(), static_cast<std::streamsize>(file_part->body.size()));
        temp_ofs.close();

        try {
            Transfer::UploadResult result = store->uploadFile(temp_filepath, filename_to_use);

            crow::json::wvalue response_json;
            response_json["root"] = result.root.str();
            response_json["fileName"] = result.manifest.file_name;
            response_json["totalSize"] = result.manifest.total_size;
            response_json["chunkSize"] = result.manifest.chunk_size;
            response_json["chunkCount"] = result.manifest.chunks.size();
            response_json["wholeFileHash"] = result.manifest.whole_file_hash;
            response_json["createdAt"] = result.manifest.created_at;
            return crow::response(201, response_json); // 201 Created
        } catch (const StoreError& e) {
            std::cerr << "Error during file upload: " << e.what() << std::endl;
            return errorResponse(e);
        } catch (const std::exception& e) {
            std::cerr << "Error during file upload: " << e.what() << std::endl;
            return crow::response(500, "Internal Server Error: " + std::string(e.what()));
        }
    });

    // --- GET /files/<root>: Retrieve a stored file ---
    CROW_ROUTE(app, "/files/<string>")
    ([store](const crow::request&, std::string root) {
        try {
            ScratchDirectory scratch;
            Transfer::DownloadResult result = store->retrieveFile(RootReference(root), scratch.path());

            std::ifstream ifs(result.path, std::ios::binary);
            if (!ifs.is_open()) {
                return crow::response(500, "Internal Server Error: Could not open retrieved file.");
            }
            std::string buffer((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

            crow::response res(200);
            res.set_header("Content-Type", "application/octet-stream");
            res.set_header("Content-Disposition", "attachment; filename=\"" + result.manifest.file_name + "\"");
            res.write(buffer);
            return res;
        } catch (const StoreError& e) {
            std::cerr << "Error retrieving file: " << e.what() << std::endl;
            return errorResponse(e);
        } catch (const std::exception& e) {
            std::cerr << "Error retrieving file: " << e.what() << std::endl;
            return crow::response(500, "Internal Server Error: " + std::string(e.what()));
        }
    });

    // --- GET /files: The catalogue of stored files ---
    CROW_ROUTE(app, "/files").methods("GET"_method)
    ([store](const crow::request&) {
        try {
            std::vector<crow::json::wvalue> files;
            for (const auto& entry : store->listAllFiles()) {
                files.push_back(entryJson(entry));
            }
            crow::json::wvalue response_json;
            response_json["files"] = std::move(files);
            return crow::response(200, response_json);
        } catch (const StoreError& e) {
            std::cerr << "Error listing files: " << e.what() << std::endl;
            return errorResponse(e);
        }
    });

    const unsigned short port = vm["port"].as<unsigned short>();
    std::cout << "Starting ChannelStore service for channel " << store->channel()
              << " on http://localhost:" << port << std::endl;
    app.port(port).multithreaded().run();

    return 0;
}
