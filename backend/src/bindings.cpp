#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <memory>
#include <stdexcept>
#include "ClassifierConfig.hpp"
#include "FeedbackService.hpp"

namespace py = pybind11;

// One service per interpreter, loaded on first use
static std::unique_ptr<FeedbackService> g_service;

static void load(const std::string& config_path) {
    if (g_service) {
        throw std::runtime_error("feedback_engine is already loaded");
    }

    ClassifierConfig config;
    if (!config_path.empty() && !config.load_from_file(config_path)) {
        throw std::runtime_error("Could not load config: " + config_path);
    }

    auto service = std::make_unique<FeedbackService>();
    if (!service->initialize(config)) {
        throw std::runtime_error("Could not load lexicons or abuse rules");
    }
    g_service = std::move(service);
}

static const FeedbackService& service() {
    if (!g_service) {
        load("");
    }
    return *g_service;
}

static py::dict classify(const std::string& text) {
    ClassificationResult result = service().classifier().classify(text);
    py::dict out;
    out["classification"] = to_string(result.classification);
    if (result.sentiment) {
        out["sentiment"] = to_string(*result.sentiment);
    }
    return out;
}

static std::string classify_verbose(const std::string& text) {
    return service().check_feedback(text, true);
}

PYBIND11_MODULE(feedback_engine, m) {
    m.def("load", &load, py::arg("config_path") = "", "Load lexicons and rules (defaults when no config path)");
    m.def("classify", &classify, "Classify feedback text as Abusive / Clean with sentiment");
    m.def("classify_verbose", &classify_verbose, "Classification with per-token details as a JSON string");
}
