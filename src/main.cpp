#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "Config.h"
#include "ProductionLine.h"
#include "Report.h"

using namespace std;

static Report runLine(const LineConfig& config) {
    ProductionLine line(config);
    line.start();
    line.waitCompletion();

    Report report = line.report();
    printReport(report, cout);
    printAnalysis(report, cout);

    if (!config.reportFile.empty()) {
        saveReport(report, config.reportFile);
        cout << "Report saved to: " << config.reportFile << endl;
    }
    if (!config.analysisFile.empty()) {
        saveAnalysis(report, config.analysisFile);
        cout << "Analysis saved to: " << config.analysisFile << endl;
    }
    return report;
}

int main(int argc, char* argv[]) {
    if (argc > 1 && (string(argv[1]) == "-h" || string(argv[1]) == "--help")) {
        cout << "Usage: " << argv[0] << " [config_file ...]" << endl;
        cout << "  Without arguments the reduced toy configuration is run." << endl;
        return 0;
    }

    try {
        // 1. Parse configs up front so a bad file fails before any run starts
        vector<LineConfig> configs;
        if (argc < 2) {
            configs.push_back(toyConfig());
        } else {
            for (int i = 1; i < argc; ++i) {
                configs.push_back(parseConfig(argv[i]));
                validateConfig(configs.back());
            }
        }

        // 2. Run each line in turn
        vector<Report> reports;
        for (size_t i = 0; i < configs.size(); ++i) {
            cout << string(70, '=') << endl;
            cout << "RUN " << (i + 1) << " OF " << configs.size() << endl;
            cout << string(70, '=') << endl;
            reports.push_back(runLine(configs[i]));
            cout << endl;
        }

        // 3. Compare
        if (reports.size() > 1) {
            cout << "[COMPARISON]" << endl;
            printComparison(reports, cout);
        }
    } catch (const ConfigurationError& e) {
        cerr << "ERROR: invalid configuration: " << e.what() << endl;
        return 1;
    } catch (const exception& e) {
        cerr << "ERROR: " << e.what() << endl;
        return 1;
    }

    return 0;
}
