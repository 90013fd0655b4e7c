// basic_usage — the three delta strategies through the text API
//
// Diffs one pair of documents structurally, operationally and
// semantically, then patches, validates and inverts each delta.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <jsondelta-cpp/jsondelta.hpp>

#include <easylogging++.h>

#include <cstdio>
#include <string>
#include <vector>

INITIALIZE_EASYLOGGINGPP

namespace jd = jsondelta_cpp;

namespace {

void show(const char* label, const jd::Result<std::string>& r) {
    if (r.ok()) {
        std::printf("%-22s %s\n", label, r.value().c_str());
    } else {
        std::printf("%-22s error (%s): %s\n", label,
                    std::string{jd::to_string_view(r.error().kind)}.c_str(),
                    r.error().message.c_str());
    }
}

}  // namespace

int main() {
    jd::configure_logging(jd::LogSettings{.level = jd::LogLevel::warning, .to_stdout = true, .file = {}});

    const auto old_doc = std::string{R"({
        "@id": "http://example.org/ada",
        "name": "Ada",
        "languages": ["english", "french", "italian"],
        "notes": "Wrote the first published algorithm intended for a machine."
    })"};
    const auto new_doc = std::string{R"({
        "@id": "http://example.org/ada",
        "name": "Ada Lovelace",
        "languages": ["italian", "english", "french"],
        "notes": "Wrote the first published algorithm intended for the Analytical Engine.",
        "born": 1815
    })"};

    // -- Structural: jsondiffpatch deltas -------------------------------------
    std::printf("=== structural ===\n");
    const auto delta = jd::diff(jd::Strategy::structural, old_doc, new_doc);
    show("delta:", delta);
    if (delta.ok()) {
        show("patched:", jd::patch(jd::Strategy::structural, old_doc, delta.value()));
        const auto inv = jd::inverse(jd::Strategy::structural, delta.value());
        show("inverse:", inv);
        if (inv.ok()) show("reverted:", jd::patch(jd::Strategy::structural, new_doc, inv.value()));
    }

    // Positional arrays and no text diffs.
    show("positional delta:", jd::diff(jd::Strategy::structural, old_doc, new_doc,
                                       {{"include_moves", "false"}, {"text_diff", "false"}}));

    // -- Operational: timestamped operation logs ------------------------------
    std::printf("\n=== operational ===\n");
    const auto log = jd::diff(jd::Strategy::operational, old_doc, new_doc,
                              {{"actor_id", "alice"}, {"timestamp", "1000"}});
    show("log:", log);
    if (log.ok()) {
        show("replayed:", jd::patch(jd::Strategy::operational, old_doc, log.value()));
        const auto valid = jd::validate(jd::Strategy::operational, old_doc, log.value());
        std::printf("%-22s %s\n", "valid:", valid.ok() && valid.value() ? "yes" : "no");

        const auto other = jd::diff(jd::Strategy::operational, old_doc, R"({"name":"Countess"})",
                                    {{"actor_id", "bob"}, {"timestamp", "1001"}});
        if (other.ok()) {
            const auto logs = std::vector<std::string>{log.value(), other.value()};
            show("merged:", jd::merge(jd::Strategy::operational, logs));
        }
    }

    // -- Semantic: RDF triple deltas ------------------------------------------
    std::printf("\n=== semantic ===\n");
    const auto semantic = jd::diff(jd::Strategy::semantic, old_doc, new_doc);
    show("delta:", semantic);
    if (semantic.ok()) {
        show("patched:", jd::patch(jd::Strategy::semantic, old_doc, semantic.value()));
    }
    show("expanded:", jd::expand_text(old_doc));

    // -- Errors are values ----------------------------------------------------
    std::printf("\n=== errors ===\n");
    show("bad document:", jd::diff(jd::Strategy::structural, "{", "{}"));
    show("bad log:", jd::patch(jd::Strategy::operational, "{}", R"({"operations": 1})"));

    return 0;
}
