/**
 * Typewriter player: types a file (or stdin) onto the terminal in real time.
 * Usage: inkwell-play [--speed ms] [--var name=value]... [--skip] [--quiet] [--log-file path] [file]
 */

#include "inkwell/typewriter/engine.hpp"
#include "inkwell/typewriter/error.hpp"
#include "inkwell/core/logger.hpp"
#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>

using namespace inkwell;
using namespace inkwell::typewriter;

namespace {

struct PendingCompletion {
    f64 deadline;
    Completion completion;
};

void print_usage() {
    std::cerr << "Usage: inkwell-play [--speed ms] [--var name=value]... [--skip] [--quiet] "
                 "[--log-file path] [file]\n";
}

String to_upper(const String& text) {
    std::string result = text.std_string();
    for (auto& c : result) {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - ('a' - 'A'));
        }
    }
    return String(std::move(result));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    logging::init();
    logging::set_level(LogLevel::Warn);

    EngineOptions options;
    std::vector<std::pair<String, String>> variables;
    bool skip_immediately = false;
    const char* path = nullptr;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--speed") == 0 && i + 1 < argc) {
            auto speed = parse_duration(String(argv[++i]));
            if (!speed) {
                std::cerr << "Error: invalid speed: " << argv[i] << "\n";
                return 1;
            }
            options.speed = speed.value();
        } else if (std::strcmp(argv[i], "--var") == 0 && i + 1 < argc) {
            String assignment(argv[++i]);
            auto equals = assignment.find('=');
            if (!equals) {
                std::cerr << "Error: expected name=value, got: " << argv[i] << "\n";
                return 1;
            }
            variables.emplace_back(assignment.substring(0, *equals), assignment.substring(*equals + 1));
        } else if (std::strcmp(argv[i], "--skip") == 0) {
            skip_immediately = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            logging::set_level(LogLevel::Error);
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            auto sink = std::make_unique<FileSink>(argv[++i]);
            if (!sink->is_open()) {
                std::cerr << "Error: Cannot open log file: " << argv[i] << "\n";
                return 1;
            }
            logging::add_sink(std::move(sink));
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            print_usage();
            return 1;
        } else {
            path = argv[i];
        }
    }

    String text;
    std::ostringstream buffer;
    if (path) {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in) {
            std::cerr << "Error: Cannot open file: " << path << "\n";
            return 1;
        }
        buffer << in.rdbuf();
    } else {
        buffer << std::cin.rdbuf();
    }
    text = String(buffer.str());

    SteadyClock clock;
    StreamSurface surface(std::cout);
    std::vector<PendingCompletion> pending;

    try {
        Engine engine(surface, clock, options);

        for (const auto& [name, value] : variables) {
            engine.set_variable(name, value);
        }

        engine.set_function("upper", [](const Argument& argument) -> Value {
            return argument ? to_upper(*argument) : String();
        });
        engine.set_function("bell", [](const Argument&) -> Value {
            std::cout << '\a' << std::flush;
            return {};
        });
        engine.set_async_function("wait", [&clock, &pending](const Argument& argument) {
            f64 ms = 0;
            if (argument) {
                ms = parse_duration(*argument).value_or(0);
            }
            Completion completion;
            pending.push_back({clock.now_ms() + ms, completion});
            return completion;
        });

        INKWELL_LOG_DEBUG_FMT("Playing {} bytes at {} ms per token", text.size(), options.speed);
        engine.write(text);
        if (skip_immediately) {
            engine.skip();
        }

        while (engine.status() != Status::Idle && engine.status() != Status::Halted) {
            // Settle demo completions that are due
            f64 now = clock.now_ms();
            for (usize i = 0; i < pending.size();) {
                if (pending[i].deadline <= now) {
                    Completion done = pending[i].completion;
                    pending.erase(pending.begin() + static_cast<isize>(i));
                    done.resolve();
                } else {
                    ++i;
                }
            }

            engine.process_tasks();

            std::optional<f64> wake = engine.next_task_time();
            for (const auto& entry : pending) {
                if (!wake || entry.deadline < *wake) {
                    wake = entry.deadline;
                }
            }
            if (!wake) {
                break;
            }

            f64 sleep_ms = *wake - clock.now_ms();
            if (sleep_ms > 0) {
                std::this_thread::sleep_for(std::chrono::duration<f64, std::milli>(sleep_ms));
            }
        }

        std::cout << "\n";
        if (engine.status() == Status::Halted) {
            INKWELL_LOG_WARN("Playback halted before the end of the input");
        } else {
            INKWELL_LOG_INFO("Playback finished");
        }
        int exit_code = engine.status() == Status::Halted ? 2 : 0;
        logging::shutdown();
        return exit_code;
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        logging::shutdown();
        return 1;
    }
}
