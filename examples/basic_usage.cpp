// basic_usage — demonstrates the core firestore-cpp API
//
// Signs in, creates a document, reads it back, patches it with a PatchSpec
// and with a PatchBuilder, and deletes it again.
//
// Build: cmake --build build
// Run:   ./build/basic_usage config.json user@example.com password

#include <firestore-cpp/firestore.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

namespace fs = firestore_cpp;

namespace {

auto print_map(const fs::Map& m, int indent = 2) -> void;

auto print_value(const fs::Value& v, int indent) -> void {
    std::visit(fs::overload{
        [](fs::Null) { std::printf("null\n"); },
        [](bool b) { std::printf("%s\n", b ? "true" : "false"); },
        [](std::int64_t i) { std::printf("%lld\n", static_cast<long long>(i)); },
        [](double d) { std::printf("%g\n", d); },
        [](const std::string& s) { std::printf("\"%s\"\n", s.c_str()); },
        [](const fs::Bytes& b) { std::printf("<%zu bytes>\n", b.size()); },
        [&](const fs::List& l) {
            std::printf("[\n");
            for (const auto& e : l) {
                std::printf("%*s", indent + 2, "");
                print_value(e, indent + 2);
            }
            std::printf("%*s]\n", indent, "");
        },
        [&](const fs::Map& m) {
            std::printf("{\n");
            print_map(m, indent + 2);
            std::printf("%*s}\n", indent, "");
        },
        [](const fs::GeoPoint& g) { std::printf("(%g, %g)\n", g.latitude, g.longitude); },
        [](const fs::Timestamp& t) { std::printf("%s\n", t.value.c_str()); },
        [](const fs::Reference& r) { std::printf("-> %s\n", r.path.c_str()); },
    }, v.variant());
}

auto print_map(const fs::Map& m, int indent) -> void {
    for (const auto& [key, value] : m) {
        std::printf("%*s%s: ", indent, "", key.c_str());
        print_value(value, indent);
    }
}

auto fail(const char* what, const fs::Error& error) -> int {
    std::fprintf(stderr, "%s failed (%s): %s\n", what,
                 std::string{fs::to_string_view(error.kind)}.c_str(), error.message.c_str());
    return 1;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc != 4) {
        std::fprintf(stderr, "usage: %s <config.json> <email> <password>\n", argv[0]);
        return 2;
    }
    spdlog::set_level(spdlog::level::debug);

    auto config = fs::load_config(argv[1]);
    if (!config) return fail("load_config", config.error());

    auto http = std::make_shared<fs::CurlHttpClient>(config->connect_timeout_ms,
                                                     config->request_timeout_ms);
    auto auth = std::make_shared<fs::Auth>(*config, http);
    if (auto cred = auth->sign_in_with_password(argv[2], argv[3]); !cred) {
        return fail("sign in", cred.error());
    }
    auto client = fs::Client{*config, auth, http};

    // -- Create: the document id defaults to the signed-in user's id ----------
    auto created = client.create("examples", std::nullopt, fs::Map{
        {"title", "Shopping List"},
        {"items", fs::List{"Milk", "Eggs", "Bread"}},
        {"config", fs::Map{{"theme", "dark"}, {"max_items", 100}}},
        {"store", fs::GeoPoint{59.91, 10.75}},
        {"owner", fs::Reference{client.document_name("users", *auth->local_id())}},
    });
    if (!created) return fail("create", created.error());
    std::printf("created %s at %s\n", created->name.c_str(), created->update_time.c_str());

    // -- Update with a nested PatchSpec ---------------------------------------
    auto spec = fs::PatchSpec{
        .replace = {
            {"items", fs::ListReplace{{1, "Free-range eggs"}, {3, "Butter"}}},
            {"config", fs::ReplaceMap{{"theme", "light"}}},
        },
        .remove = {{"store", fs::Remove{}}},
    };
    auto updated = client.update("examples", std::nullopt, spec);
    if (!updated) return fail("update", updated.error());

    // -- Update with flat paths and a transform -------------------------------
    auto built = fs::PatchBuilder{}
        .remove({"items", std::size_t{0}})
        .transform([](fs::Map m) {
            auto n = fs::get_value<std::int64_t>(m, "revision").value_or(0);
            m["revision"] = n + 1;
            return m;
        })
        .build();
    if (!built) return fail("build patch", built.error());

    updated = client.update("examples", std::nullopt, *built);
    if (!updated) {
        if (updated.error().kind == fs::ErrorKind::conflict) {
            std::printf("someone else wrote first; not retrying\n");
        }
        return fail("update", updated.error());
    }

    std::printf("document at %s:\n", updated->update_time.c_str());
    print_map(updated->fields);

    if (auto removed = client.remove("examples", std::nullopt); !removed) {
        return fail("remove", removed.error());
    }
    std::printf("removed\n");
    return 0;
}
