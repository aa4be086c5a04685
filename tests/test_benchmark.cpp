#include <benchmark/benchmark.h>

#include "classifier/command_classifier.hpp"
#include "core/utils.hpp"
#include "filter/ai_command_filter.hpp"
#include "filter/command_extractor.hpp"
#include "sanitizer/command_sanitizer.hpp"

#include <string>
#include <vector>

using namespace cmdguard;

// ============================================================================
// Inputs
// ============================================================================

namespace {

const std::string kCleanCommand = "git commit -m \"fix: handle empty input\"";
const std::string kThaiCommand = "\xE0\xB9\x81" "git add .";
const std::string kNoisyCommand =
    "\xE2\x80\x8B" "npm" "\x07" " install " "\xE0\xB9\x81" "--save-dev typescript" "\xEF\xBB\xBF";

const std::vector<std::string> kClassifierInputs = {
    "git status", "npm install express", "rm -rf node_modules", "ls -la",
    "taskkill /f /im node.exe", "make build", "echo hello", "git log --format=oneline",
};

std::string make_ai_reply(int blocks) {
    std::string reply = "Here is how to set the project up:\n\n";
    for (int i = 0; i < blocks; ++i) {
        reply += "First install dependencies:\n"
                 "```bash\n"
                 "npm install\n"
                 "# run the tests\n"
                 "npm test\n"
                 "```\n"
                 "Then check the repository state:\n"
                 "$ git status\n"
                 "\xE0\xB9\x81" "git add .\n"
                 "That should be all.\n\n";
    }
    return reply;
}

} // anonymous namespace

// ============================================================================
// Sanitizer
// ============================================================================

static void BM_Sanitizer_Clean(benchmark::State& state) {
    for (auto _ : state) {
        auto r = CommandSanitizer::sanitize(kCleanCommand);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Sanitizer_Clean);

static void BM_Sanitizer_Noisy(benchmark::State& state) {
    for (auto _ : state) {
        auto r = CommandSanitizer::sanitize(kNoisyCommand);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Sanitizer_Noisy);

static void BM_Sanitizer_Validate(benchmark::State& state) {
    for (auto _ : state) {
        auto r = CommandSanitizer::validate(kThaiCommand);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Sanitizer_Validate);

static void BM_Sanitizer_Report(benchmark::State& state) {
    for (auto _ : state) {
        auto r = CommandSanitizer::sanitization_report(kNoisyCommand);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Sanitizer_Report);

static void BM_Sanitizer_LongCommand(benchmark::State& state) {
    const std::string cmd(static_cast<size_t>(state.range(0)), 'a');
    for (auto _ : state) {
        auto r = CommandSanitizer::validate(cmd);
        benchmark::DoNotOptimize(r);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Sanitizer_LongCommand)->Arg(64)->Arg(512)->Arg(4096);

// ============================================================================
// Classifier
// ============================================================================

static void BM_Classifier_Categorize(benchmark::State& state) {
    size_t i = 0;
    for (auto _ : state) {
        auto c = CommandClassifier::categorize(kClassifierInputs[i++ % kClassifierInputs.size()]);
        benchmark::DoNotOptimize(c);
    }
}
BENCHMARK(BM_Classifier_Categorize);

static void BM_Classifier_AssessRisk(benchmark::State& state) {
    size_t i = 0;
    for (auto _ : state) {
        auto r = CommandClassifier::assess_risk(kClassifierInputs[i++ % kClassifierInputs.size()]);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Classifier_AssessRisk);

static void BM_Classifier_DangerousMiss(benchmark::State& state) {
    for (auto _ : state) {
        auto d = CommandClassifier::is_dangerous(kCleanCommand);
        benchmark::DoNotOptimize(d);
    }
}
BENCHMARK(BM_Classifier_DangerousMiss);

// ============================================================================
// Filter
// ============================================================================

static void BM_Extractor_Reply(benchmark::State& state) {
    const CommandExtractor extractor;
    const std::string reply = make_ai_reply(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto c = extractor.extract(reply);
        benchmark::DoNotOptimize(c);
    }
}
BENCHMARK(BM_Extractor_Reply)->Arg(1)->Arg(10)->Arg(100);

static void BM_Filter_Reply(benchmark::State& state) {
    utils::log::set_level(utils::log::Level::WARN);
    FilterConfig cfg;
    cfg.max_history = 16;
    AiCommandFilter filter(cfg);
    const std::string reply = make_ai_reply(10);
    for (auto _ : state) {
        auto r = filter.filter_ai_output(reply);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Filter_Reply);
