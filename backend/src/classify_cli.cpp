#include "ClassifierConfig.hpp"
#include "FeedbackService.hpp"
#include <filesystem>
#include <iostream>
#include <string>

using namespace std;

int main(int argc, char* argv[]) {
    ClassifierConfig config;

    string config_path = argc >= 2 ? argv[1] : find_default_config(default_config_candidates());
    if (!config_path.empty()) {
        cout << "Loading config from: " << config_path << "\n";
        if (!config.load_from_file(config_path)) {
            cerr << "Error: Failed to load config\n";
            return 1;
        }
    }

    FeedbackService service;
    if (!service.initialize(config)) {
        cerr << "Error: Failed to load lexicons or rules\n";
        cerr << "Lexicon paths are relative to " << filesystem::current_path().string()
             << "; run from backend/ or pass a config file: classify_cli <classifier.json>\n";
        return 1;
    }

    cout << "\n=========================================\n";
    cout << "   FEEDBACK CLASSIFIER\n";
    cout << "=========================================\n";
    cout << "Type feedback and press enter (':debug' toggles details, 'quit' to exit)\n\n";

    bool debug = false;
    string line;
    while (true) {
        cout << "> ";
        if (!getline(cin, line)) {
            break;
        }

        if (line == "quit" || line == "exit") {
            break;
        }

        if (line == ":debug") {
            debug = !debug;
            cout << "  debug " << (debug ? "on" : "off") << "\n";
            continue;
        }

        cout << "  " << service.check_feedback(line, debug) << "\n";
    }

    return 0;
}
