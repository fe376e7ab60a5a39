#include "common/BridgeSettings.h"
#include "common/EventLoop.h"
#include "common/Logger.h"
#include "runtime/TestExplorer.h"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

class ConsoleRun : public TEB::ITestRunSink {
public:
    explicit ConsoleRun(bool &finished) : finished_(finished) {}

    void enqueued(const TEB::TreeNode &) override {}

    void started(const TEB::TreeNode &test) override {
        std::cout << "  RUN   " << test.label() << "\n";
    }

    void passed(const TEB::TreeNode &test, double duration) override {
        std::cout << "  PASS  " << test.label() << " (" << duration << " ms)\n";
    }

    void skipped(const TEB::TreeNode &test) override {
        std::cout << "  SKIP  " << test.label() << "\n";
    }

    void failed(const TEB::TreeNode &test, const std::vector<TEB::TestMessage> &messages, double) override {
        std::cout << "  FAIL  " << test.label() << "\n";
        for (const auto &message : messages) {
            std::cout << "        " << message.text << "\n";
        }
    }

    void appendOutput(const std::string &) override {}

    void end() override {
        finished_ = true;
    }

private:
    bool &finished_;
};

void printNode(const TEB::TreeNode &node, int depth) {
    std::cout << std::string(depth * 2, ' ') << "[" << TEB::toString(node.kind()) << "] " << node.label() << "\n";
    for (const auto &child : node.children()) {
        printNode(*child, depth + 1);
    }
}

}  // namespace

int main(int argc, char *argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <workspace folder> [--run]\n";
        return 2;
    }
    const std::string workspace = argv[1];
    const bool run = argc > 2 && std::string(argv[2]) == "--run";

    TEB::BridgeSettings settings = TEB::BridgeSettings::fromEnvironment();
    TEB::Logger::initialize(settings.logDir);

    TEB::EventLoop loop;
    bool runFinished = false;
    TEB::TestExplorer explorer(loop, settings, [&runFinished](const TEB::RunRequest &) {
        return std::make_unique<ConsoleRun>(runFinished);
    });

    bool loaded = false;
    for (const auto &warning : explorer.rebuild({workspace}, [&loaded]() { loaded = true; })) {
        std::cerr << "warning: " << warning << "\n";
    }
    loop.runUntil([&loaded]() { return loaded; }, std::chrono::seconds(60));

    // Files are listed lazily; list all of them for the printout
    std::vector<std::string> files;
    for (const auto *model : explorer.models()) {
        const auto enabled = model->enabledFiles();
        files.insert(files.end(), enabled.begin(), enabled.end());
    }
    explorer.listTests(files);
    loop.runUntil([&explorer]() { return explorer.bridge().activeProcessCount() == 0; }, std::chrono::seconds(60));

    for (const auto &node : explorer.tree().root().children()) {
        printNode(*node, 0);
    }

    if (run) {
        for (const auto *model : explorer.models()) {
            for (const auto *project : model->enabledProjects()) {
                TEB::RunRequest request;
                request.configFile = model->config().configFile;
                request.projectName = project->name;
                explorer.scheduleRun(request);
            }
        }
        loop.runUntil([&runFinished]() { return runFinished; }, std::chrono::minutes(30));
    }

    TEB::Logger::flush();
    return 0;
}
