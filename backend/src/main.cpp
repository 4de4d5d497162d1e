#include <httplib.h>
#include <nlohmann/json.hpp>
#include "ClassifierConfig.hpp"
#include "FeedbackService.hpp"
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

static bool is_truthy(const std::string& value) {
    return value == "1" || value == "true" || value == "yes";
}

int main(int argc, char* argv[]) {
    std::cout << "[Main] Starting feedback classifier...\n";

    ClassifierConfig config;
    std::string config_path = argc >= 2 ? argv[1] : find_default_config(default_config_candidates());
    if (!config_path.empty()) {
        if (!config.load_from_file(config_path)) {
            std::cerr << "[Main] Refusing to start with an invalid config\n";
            return 1;
        }
    } else {
        std::cout << "[Main] No config file found, using defaults\n";
    }

    // Lexicons and rules are loaded exactly once; without them abuse detection would be silently off
    FeedbackService service;
    if (!service.initialize(config)) {
        std::cerr << "[Main] Startup failed, not serving requests\n";
        std::cerr << "[Main] Lexicon paths are relative to " << fs::current_path().string()
                  << "; run from backend/ or pass a config file: feedback_server <classifier.json>\n";
        return 1;
    }

    httplib::Server svr;

    // CORS middleware - Add CORS headers to all responses
    svr.set_post_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    // Handle CORS preflight requests
    svr.Options(".*", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    // Serve static files (the feedback form) when the directory exists
    if (fs::is_directory(config.static_dir)) {
        svr.set_mount_point("/", config.static_dir);
        svr.set_file_extension_and_mimetype_mapping("js", "application/javascript");
        svr.set_file_extension_and_mimetype_mapping("css", "text/css");
        svr.set_file_extension_and_mimetype_mapping("html", "text/html");
    } else {
        std::cout << "[Server] No static directory at " << config.static_dir << ", serving API only\n";
    }

    svr.Get("/api", [&](const httplib::Request&, httplib::Response& res) {
        res.set_content(service.status(), "application/json");
    });

    svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("{\"status\": \"ok\"}", "application/json");
    });

    // Define Route: POST /check_feedback  {"text": "...", "debug": false}
    svr.Post("/check_feedback", [&](const httplib::Request& req, httplib::Response& res) {
        std::string text;
        bool debug = req.has_param("debug") && is_truthy(req.get_param_value("debug"));

        if (!req.body.empty()) {
            try {
                json body = json::parse(req.body);
                if (!body.is_object()) {
                    res.status = 400;
                    res.set_content("{\"error\": \"Expected a JSON object\"}", "application/json");
                    return;
                }
                text = body.value("text", std::string());
                debug = debug || body.value("debug", false);
            } catch (const json::exception& e) {
                res.status = 400;
                json err = {{"error", std::string("Invalid JSON body: ") + e.what()}};
                res.set_content(err.dump(), "application/json");
                return;
            }
        }

        res.set_content(service.check_feedback(text, debug), "application/json");
    });

    std::cout << "======================================" << std::endl;
    std::cout << "   Feedback Classifier" << std::endl;
    std::cout << "======================================" << std::endl;
    std::cout << "API Endpoints:" << std::endl;
    std::cout << "  - POST /check_feedback  {\"text\": \"...\"}" << std::endl;
    std::cout << "  - GET  /api" << std::endl;
    std::cout << "  - GET  /health" << std::endl;
    std::cout << "======================================" << std::endl;
    std::cout << "Listening on " << config.host << ":" << config.port << std::endl;
    std::cout << "======================================" << std::endl;

    if (!svr.listen(config.host, config.port)) {
        std::cerr << "[Server] Failed to start server!" << std::endl;
        return 1;
    }

    return 0;
}
