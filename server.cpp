// server.cpp
#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include <memory> // For std::make_shared

// Crow includes
#include <crow.h>

#include <nlohmann/json.hpp>

// Our project includes
#include "batch_runner.hpp"
#include "split_config.hpp"
#include "split_errors.hpp"
#include "split_manifest.hpp"

namespace fs = std::filesystem;

using FileSplitter::ErrorKind;
using FileSplitter::SplitError;
using FileSplitter::Batch::BatchRunner;
using FileSplitter::Batch::FileOutcome;
using FileSplitter::Config::SplitConfig;
using FileSplitter::Metadata::ManifestCodec;

namespace {

crow::response jsonResponse(int code, const nlohmann::json& body) {
    crow::response res(code, body.dump(4));
    res.set_header("Content-Type", "application/json");
    return res;
}

crow::response errorResponse(int code, const std::string& message) {
    return jsonResponse(code, nlohmann::json{{"error", message}});
}

nlohmann::json outcomesToJson(const std::vector<FileOutcome>& outcomes) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& outcome : outcomes) {
        nlohmann::json entry;
        entry["input"] = outcome.input.string();
        entry["success"] = outcome.success;
        if (outcome.success) {
            entry["output"] = outcome.output.string();
        } else {
            entry["error"] = outcome.error_kind ? FileSplitter::errorKindName(*outcome.error_kind) : "Unexpected";
            entry["message"] = outcome.message;
        }
        list.push_back(entry);
    }
    return list;
}

// Reads a list of path strings from body[key]; throws json::exception on a bad shape
std::vector<fs::path> pathList(const nlohmann::json& body, const std::string& key) {
    std::vector<fs::path> paths;
    for (const auto& item : body.at(key)) {
        paths.emplace_back(item.get<std::string>());
    }
    if (paths.empty()) {
        throw SplitError(ErrorKind::InvalidConfig, "'" + key + "' must name at least one path");
    }
    return paths;
}

crow::response batchResponse(const std::vector<FileOutcome>& outcomes) {
    return jsonResponse(BatchRunner::allSucceeded(outcomes) ? 200 : 422, outcomesToJson(outcomes));
}

} // namespace

int main(int argc, char* argv[]) {
    SplitConfig config;
    try {
        if (argc > 1) {
            config = SplitConfig::loadFromFile(argv[1]);
        }
        config.validate();
    } catch (const SplitError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    // Shared across request handlers; each batch call owns its own outcomes
    auto runner = std::make_shared<BatchRunner>(config);

    crow::SimpleApp app;

    // --- POST /split: {"files": [...], "size_limit": N, "output_dir": "...", "compress": bool} ---
    CROW_ROUTE(app, "/split").methods("POST"_method)
    ([runner, config](const crow::request& req) {
        std::vector<fs::path> files;
        uint64_t size_limit = config.size_limit;
        fs::path output_dir = ".";
        bool compress = config.compress;
        try {
            nlohmann::json body = nlohmann::json::parse(req.body);
            files = pathList(body, "files");
            if (body.contains("size_limit")) {
                if (!body.at("size_limit").is_number_unsigned() || body.at("size_limit").get<uint64_t>() == 0) {
                    return errorResponse(400, "'size_limit' must be a positive integer");
                }
                size_limit = body.at("size_limit").get<uint64_t>();
            }
            if (body.contains("output_dir")) {
                output_dir = body.at("output_dir").get<std::string>();
            }
            if (body.contains("compress")) {
                compress = body.at("compress").get<bool>();
            }
        } catch (const nlohmann::json::exception& e) {
            return errorResponse(400, std::string("Bad Request: ") + e.what());
        } catch (const SplitError& e) {
            return errorResponse(400, std::string("Bad Request: ") + e.detail());
        }

        try {
            return batchResponse(runner->splitAll(files, size_limit, output_dir, compress));
        } catch (const std::exception& e) {
            std::cerr << "Error during split: " << e.what() << std::endl;
            return errorResponse(500, std::string("Internal Server Error: ") + e.what());
        }
    });

    // --- POST /restore: {"manifests": [...], "input_dir": "...", "output_dir": "..."} ---
    CROW_ROUTE(app, "/restore").methods("POST"_method)
    ([runner](const crow::request& req) {
        std::vector<fs::path> manifests;
        fs::path input_dir = ".";
        fs::path output_dir = ".";
        try {
            nlohmann::json body = nlohmann::json::parse(req.body);
            manifests = pathList(body, "manifests");
            if (body.contains("input_dir")) {
                input_dir = body.at("input_dir").get<std::string>();
            }
            if (body.contains("output_dir")) {
                output_dir = body.at("output_dir").get<std::string>();
            }
        } catch (const nlohmann::json::exception& e) {
            return errorResponse(400, std::string("Bad Request: ") + e.what());
        } catch (const SplitError& e) {
            return errorResponse(400, std::string("Bad Request: ") + e.detail());
        }

        try {
            return batchResponse(runner->restoreAll(manifests, input_dir, output_dir));
        } catch (const std::exception& e) {
            std::cerr << "Error during restore: " << e.what() << std::endl;
            return errorResponse(500, std::string("Internal Server Error: ") + e.what());
        }
    });

    // --- GET /manifest?path=...: decoded and validated manifest ---
    CROW_ROUTE(app, "/manifest")
    ([](const crow::request& req) {
        const char* path_param = req.url_params.get("path");
        if (path_param == nullptr || std::string(path_param).empty()) {
            return errorResponse(400, "Bad Request: 'path' query parameter is required.");
        }
        fs::path manifest_path(path_param);
        std::error_code ec;
        if (!fs::exists(manifest_path, ec)) {
            return errorResponse(404, "Manifest not found: " + manifest_path.string());
        }
        try {
            auto manifest = ManifestCodec::load(manifest_path);
            ManifestCodec::validate(manifest);
            return jsonResponse(200, ManifestCodec::toJson(manifest));
        } catch (const SplitError& e) {
            std::cerr << "Error reading manifest: " << e.what() << std::endl;
            return errorResponse(422, e.what());
        }
    });

    std::cout << "Starting File Splitter Service on http://localhost:" << config.server_port << std::endl;
    app.port(config.server_port).multithreaded().run();

    return 0;
}
