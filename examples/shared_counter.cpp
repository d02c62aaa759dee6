// shared_counter — many threads, one document, optimistic concurrency
//
// Demonstrates: one Auth and one Client shared by several threads, each
// incrementing the same counter with a transform. Writes that lose the
// race come back as ErrorKind::conflict; the retry loop lives here, in the
// caller, not in the library.
//
// Build: cmake --build build
// Run:   ./build/shared_counter config.json user@example.com password [threads]

#include <firestore-cpp/firestore.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace fs = firestore_cpp;

int main(int argc, char** argv) {
    if (argc < 4) {
        std::fprintf(stderr, "usage: %s <config.json> <email> <password> [threads]\n", argv[0]);
        return 2;
    }
    const int thread_count = argc > 4 ? std::atoi(argv[4]) : 8;
    constexpr int max_attempts = 5;

    spdlog::set_level(spdlog::level::info);

    auto config = fs::load_config(argv[1]);
    if (!config) {
        std::fprintf(stderr, "config: %s\n", config.error().message.c_str());
        return 1;
    }

    auto http = std::make_shared<fs::CurlHttpClient>(config->connect_timeout_ms,
                                                     config->request_timeout_ms);
    auto auth = std::make_shared<fs::Auth>(*config, http);
    if (auto cred = auth->sign_in_with_password(argv[2], argv[3]); !cred) {
        std::fprintf(stderr, "sign in: %s\n", cred.error().message.c_str());
        return 1;
    }
    auto client = fs::Client{*config, auth, http};

    auto created = client.create("counters", std::nullopt, fs::Map{{"value", 0}});
    if (!created && created.error().kind != fs::ErrorKind::conflict) {
        std::fprintf(stderr, "create: %s\n", created.error().message.c_str());
        return 1;
    }

    const auto increment = fs::PatchSpec{.transform = [](fs::Map m) {
        m["value"] = fs::get_value<std::int64_t>(m, "value").value_or(0) + 1;
        return m;
    }};

    auto conflicts = std::atomic<int>{0};
    auto failures = std::atomic<int>{0};
    {
        auto threads = std::vector<std::jthread>{};
        for (int t = 0; t < thread_count; ++t) {
            threads.emplace_back([&] {
                for (int attempt = 1; attempt <= max_attempts; ++attempt) {
                    auto r = client.update("counters", std::nullopt, increment);
                    if (r) return;
                    if (r.error().kind != fs::ErrorKind::conflict) {
                        std::fprintf(stderr, "update: %s\n", r.error().message.c_str());
                        break;
                    }
                    ++conflicts;
                }
                ++failures;
            });
        }
    }

    auto final_doc = client.read("counters", std::nullopt);
    if (!final_doc) {
        std::fprintf(stderr, "read: %s\n", final_doc.error().message.c_str());
        return 1;
    }
    std::printf("counter = %lld after %d threads (%d conflicts, %d gave up)\n",
                static_cast<long long>(
                    fs::get_value<std::int64_t>(final_doc->fields, "value").value_or(-1)),
                thread_count, conflicts.load(), failures.load());
    return 0;
}
