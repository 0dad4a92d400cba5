#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "scoring/feedback.hpp"
#include "scoring/reduction_policy.hpp"
#include "scoring/score_type.hpp"
#include "scoring/status_text.hpp"
#include "scoring/submission.hpp"
#include "scoring/task.hpp"
#include "scoring/task_score.hpp"
#include "scoring/translation.hpp"
using namespace std;
using namespace nlohmann;

static json score_submissions(const scoring::task &task, const vector<string> &result_paths, const scoring::translation &t, bool localize) {
    auto score_type = scoring::create_score_type(task.active_dataset);

    json report = {{"task", task.name},
                   {"max_score", score_type->max_score()},
                   {"max_public_score", score_type->max_public_score()},
                   {"ranking_headers", score_type->ranking_headers()}};

    vector<scoring::score_result> results;
    json result_reports = json::array();
    for (auto &path : result_paths) {
        LOG(INFO) << "Scoring submission result " << path;
        auto submission = scoring::load_submission_result(path);
        auto result = score_type->compute_score(submission);
        result.public_subtasks = scoring::apply_feedback_level(result.public_subtasks, task.feedback);
        if (localize) {
            result.subtasks = scoring::localize_subtasks(result.subtasks, t);
            result.public_subtasks = scoring::localize_subtasks(result.public_subtasks, t);
        }

        json item = result;
        item["result"] = path;
        item["compilation_text"] = scoring::format_status_text(submission.compilation_text, t);
        result_reports.push_back(item);
        results.push_back(move(result));

        if (scoring::DEBUG)
            LOG(INFO) << "Submission result " << path << " scored " << results.back().score;
    }

    report["results"] = result_reports;
    report["task_score"] = scoring::compute_task_score(results, task.mode, task.score_precision);
    return report;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("score-engine options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("task", po::value<string>(), "task configuration file (JSON) containing the active dataset and its score type")
        ("result", po::value<vector<string>>(), "submission result file (JSON), can be given multiple times for the same contestant")
        ("status", po::value<string>(), "format a single status text given as a JSON array and exit")
        ("locale", po::value<string>(), "set the locale of feedback messages. You can either pass it from environ SCORING_LOCALE")
        ("locale-dir", po::value<string>(), "set the directory with translation catalogs <locale>.json. You can either pass it from environ LOCALEDIR")
        ("localize", "translate outcome labels and format status texts in the feedback")
        ("debug", "turn on the debug mode to pretty print the report and log every scored submission")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "score-engine: compute scores and public feedback of submissions from their evaluations" << endl
             << "Usage: " << argv[0] << " --task task.json --result result.json [--result ...] [options]" << endl
             << "       " << argv[0] << " --status '[\"Execution timed out\"]' [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "score-engine 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        scoring::DEBUG = true;
    } else if (getenv("DEBUG")) {
        scoring::DEBUG = true;
    }

    if (vm.count("locale-dir")) {
        scoring::LOCALE_DIR = filesystem::path(vm.at("locale-dir").as<string>());
    } else if (getenv("LOCALEDIR")) {
        scoring::LOCALE_DIR = filesystem::path(getenv("LOCALEDIR"));
    }

    if (vm.count("locale")) {
        scoring::DEFAULT_LOCALE = vm.at("locale").as<string>();
    } else {
        scoring::DEFAULT_LOCALE = get_env("SCORING_LOCALE", scoring::DEFAULT_LOCALE);
    }

    CHECK(vm.count("status") || vm.count("task"))
        << "Either --status or --task should be specified, see --help";

    scoring::register_builtin_reduction_policies();

    try {
        auto t = scoring::load_translation(scoring::LOCALE_DIR, scoring::DEFAULT_LOCALE);

        if (vm.count("status")) {
            json status;
            try {
                status = json::parse(vm.at("status").as<string>());
            } catch (json::parse_error& e) {
                // 不是 JSON 的状态文本也交给 format_status_text 处理，得到 N/A
                status = vm.at("status").as<string>();
            }
            cout << scoring::format_status_text(status, *t) << endl;
            return EXIT_SUCCESS;
        }

        if (!vm.count("result")) {
            cerr << "At least one --result should be specified" << endl;
            return EXIT_FAILURE;
        }

        auto task = scoring::load_task(vm.at("task").as<string>());
        json report = score_submissions(task, vm.at("result").as<vector<string>>(), *t, vm.count("localize") > 0);
        cout << report.dump(scoring::DEBUG ? 2 : -1) << endl;
    } catch (scoring::scoring_exception& e) {
        LOG(ERROR) << e;
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    } catch (exception& e) {
        LOG(ERROR) << boost::diagnostic_information(e);
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
