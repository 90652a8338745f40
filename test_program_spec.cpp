// Checks command parsing from the two config encodings and rendering back.
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "program_spec.hpp"

using live_proxy::ConfigError;
using live_proxy::ProgramSpec;

namespace {

template <typename F>
bool throws_config_error(F&& f) {
    try {
        f();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

void test_simple_string_splits_on_whitespace() {
    auto spec = ProgramSpec::from_string("echo hello world");
    assert(spec.program() == "echo");
    assert(spec.arguments() == std::vector<std::string>({"hello", "world"}));

    auto spaced = ProgramSpec::from_string("  cargo\tbuild   --release \n");
    assert(spaced.program() == "cargo");
    assert(spaced.arguments() == std::vector<std::string>({"build", "--release"}));

    auto bare = ProgramSpec::from_string("make");
    assert(bare.program() == "make");
    assert(bare.arguments().empty());
}

void test_explicit_list_keeps_fragments() {
    auto spec = ProgramSpec::from_list({"git", "commit", "-m", "msg"});
    assert(spec.program() == "git");
    assert(spec.arguments() == std::vector<std::string>({"commit", "-m", "msg"}));
    assert(spec.argv() == std::vector<std::string>({"git", "commit", "-m", "msg"}));

    auto quoted = ProgramSpec::from_list({"git", "commit", "-m", "two words"});
    assert(quoted.arguments().back() == "two words");
}

void test_empty_specs_are_rejected() {
    assert(throws_config_error([] { ProgramSpec::from_string(""); }));
    assert(throws_config_error([] { ProgramSpec::from_string("   \t "); }));
    assert(throws_config_error([] { ProgramSpec::from_list({}); }));
    assert(throws_config_error([] { ProgramSpec::from_list({"ls", ""}); }));
    assert(throws_config_error([] { ProgramSpec::from_list({" ", "-l"}); }));
    assert(throws_config_error([] { ProgramSpec::from_list({"ls", "\t\n"}); }));
}

void test_json_forms() {
    auto from_string = ProgramSpec::from_json(nlohmann::json("npm run build"));
    assert(from_string.program() == "npm");
    assert(from_string.arguments().size() == 2);

    auto from_list = ProgramSpec::from_json(nlohmann::json::array({"cp", "a b", "c"}));
    assert(from_list.program() == "cp");
    assert(from_list.arguments() == std::vector<std::string>({"a b", "c"}));

    assert(throws_config_error([] { ProgramSpec::from_json(nlohmann::json(42)); }));
    assert(throws_config_error([] { ProgramSpec::from_json(nlohmann::json::array({"ls", 3})); }));
    assert(throws_config_error([] { ProgramSpec::from_json(nlohmann::json::array()); }));
}

void test_display_quotes_fragments_with_whitespace() {
    assert(ProgramSpec::from_string("echo hello world").to_string() == "echo hello world");
    assert(ProgramSpec::from_list({"git", "commit", "-m", "a message"}).to_string() ==
           "git commit -m \"a message\"");
    assert(ProgramSpec::from_list({"/opt/my tools/run", "x"}).to_string() == "\"/opt/my tools/run\" x");
}

} // namespace

int main() {
    test_simple_string_splits_on_whitespace();
    test_explicit_list_keeps_fragments();
    test_empty_specs_are_rejected();
    test_json_forms();
    test_display_quotes_fragments_with_whitespace();

    std::cout << "program_spec tests passed" << std::endl;
    return 0;
}
