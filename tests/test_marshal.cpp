#include "test_common.h"

#include "codeloop/errors.h"
#include "codeloop/json_util.h"
#include "codeloop/marshal.h"

#include <cmath>
#include <limits>

using namespace codeloop;

static Value sample_table() {
    Table t;
    t.columns = {"total_bill", "tip", "day"};
    t.data = {
        {Value::real(16.99), Value::real(10.34), Value::real(21.01)},
        {Value::real(1.01), Value::real(1.66), Value::null()},
        {Value::string("Sun"), Value::string("Sun"), Value::string("Sat")},
    };
    return Value::table(t);
}

template <typename F>
static SerializationError expect_serialization_error(F f, const std::string& what) {
    try {
        f();
    } catch (const SerializationError& e) {
        return e;
    }
    die(what + ": expected SerializationError");
    return SerializationError("", "");
}

static void test_names() {
    validate_variable_name("tips_data");
    validate_variable_name("_x1");
    for (const char* bad : {"", "1abc", "a-b", "class", "None", "emit", "INPUT_DIR", "__builtins__", "na me"}) {
        auto e = expect_serialization_error([&] { validate_variable_name(bad); }, std::string("name ") + bad);
        expect_eq_str(e.variable(), bad, "error names the variable");
    }
}

static void test_unsupported_values() {
    auto e = expect_serialization_error([] {
        validate_variables({{"ok", Value::integer(1)}, {"conn", Value::opaque("sqlite3.Connection")}});
    }, "opaque");
    expect_eq_str(e.variable(), "conn", "opaque variable named");
    expect_true(contains(e.reason(), "sqlite3.Connection"), "reason names the host type");

    e = expect_serialization_error([] {
        validate_variables({{"x", Value::list({Value::real(1.5), Value::real(std::nan(""))})}});
    }, "nan");
    expect_true(contains(e.reason(), "x[1]"), "path points at the bad element: " + e.reason());

    e = expect_serialization_error([] {
        validate_variables({{"inf", Value::real(std::numeric_limits<double>::infinity())}});
    }, "inf");

    e = expect_serialization_error([] {
        validate_variables({{"nested", Value::map({{"t", sample_table()}})}});
    }, "nested table");
    expect_true(contains(e.reason(), "nested.t"), "nested path: " + e.reason());

    Table ragged;
    ragged.columns = {"a", "b"};
    ragged.data = {{Value::integer(1), Value::integer(2)}, {Value::integer(3)}};
    e = expect_serialization_error([&] { validate_variables({{"df", Value::table(ragged)}}); }, "ragged");
    expect_true(contains(e.reason(), "ragged"), "ragged reason: " + e.reason());

    Table dup;
    dup.columns = {"a", "a"};
    dup.data = {{Value::integer(1)}, {Value::integer(2)}};
    expect_serialization_error([&] { validate_variables({{"df", Value::table(dup)}}); }, "duplicate columns");

    Table nested_cell;
    nested_cell.columns = {"a"};
    nested_cell.data = {{Value::list({Value::integer(1)})}};
    expect_serialization_error([&] { validate_variables({{"df", Value::table(nested_cell)}}); }, "non-scalar cell");
}

static void test_round_trip(const std::filesystem::path& dir) {
    VariableMap vars = {
        {"n", Value::integer(-42)},
        {"big", Value::integer(9007199254740993LL)},
        {"ratio", Value::real(0.125)},
        {"flag", Value::boolean(true)},
        {"nothing", Value::null()},
        {"label", Value::string("caf\xC3\xA9 \"quoted\" /slash\nline")},
        {"items", Value::list({Value::integer(1), Value::string("two"), Value::list({})})},
        {"cfg", Value::map({{"k", Value::real(2.5)}, {"inner", Value::map({{"z", Value::boolean(false)}})}})},
        {"tips_data", sample_table()},
    };
    auto names = marshal_variables(vars, dir);
    expect_eq_ll((long long)names.size(), (long long)vars.size(), "every variable written");
    expect_true(std::filesystem::exists(dir / "manifest.json"), "manifest written");
    expect_true(std::filesystem::exists(dir / "vars" / "tips_data.json"), "file named after the variable");

    json_util::Doc manifest = json_util::parse(read_all(dir / "manifest.json"));
    expect_true((bool)manifest, "manifest parses");
    json_object* list = nullptr;
    expect_true(json_object_object_get_ex(manifest.root, "variables", &list), "manifest has variables");
    expect_eq_ll((long long)json_object_array_length(list), (long long)vars.size(), "manifest lists all");

    // the input bundle has the same vars/ layout the output side reads
    VariableMap back = unmarshal_outputs(dir, names);
    expect_eq_ll((long long)back.size(), (long long)vars.size(), "all decoded");
    for (const auto& kv : vars) {
        auto it = back.find(kv.first);
        expect_true(it != back.end(), "decoded " + kv.first);
        expect_true(it->second == kv.second, "round trip equal for " + kv.first + ": " + render_value(it->second));
    }
    expect_true(back.at("n") != Value::real(-42.0), "int and double stay distinct");
}

static void test_all_or_nothing(const std::filesystem::path& dir) {
    VariableMap vars = {{"a", Value::integer(1)}, {"b", Value::opaque("socket")}};
    expect_serialization_error([&] { marshal_variables(vars, dir); }, "bundle with opaque");
    expect_true(!std::filesystem::exists(dir / "vars" / "a.json"), "nothing written for a doomed bundle");
    expect_true(!std::filesystem::exists(dir / "manifest.json"), "no manifest for a doomed bundle");
}

static void test_select_used() {
    VariableMap vars = {
        {"tips", Value::integer(1)},
        {"tips_data", Value::integer(2)},
        {"unused", Value::integer(3)},
    };
    auto used = select_used_variables("print(tips_data.describe())\n# tips_data2 is not tips\n", vars);
    expect_eq_ll((long long)used.size(), 2, "tips and tips_data used");
    expect_true(used.count("tips_data") && used.count("tips"), "identifier scan");
    used = select_used_variables("x_tips_data = 1\n", vars);
    expect_true(used.empty(), "substring of a longer identifier is not a use");
}

static void test_unmarshal_errors(const std::filesystem::path& dir) {
    expect_true(unmarshal_outputs(dir / "missing", {}).empty(), "nothing listed means no outputs");

    bool threw = false;
    try {
        (void)unmarshal_outputs(dir / "missing", {"x"});
    } catch (const CaptureFailed& e) {
        threw = contains(e.what(), "listed but missing");
    }
    expect_true(threw, "listed output without a file is CaptureFailed");

    write_all(dir / "out" / "vars" / "broken.json", "{\"kind\":\"value\",");
    threw = false;
    try {
        (void)unmarshal_outputs(dir / "out", {"broken"});
    } catch (const CaptureFailed& e) {
        threw = contains(e.what(), "broken");
    }
    expect_true(threw, "malformed declared output is CaptureFailed");

    threw = false;
    try {
        (void)unmarshal_outputs(dir / "out", {"../x"});
    } catch (const CaptureFailed& e) {
        threw = contains(e.what(), "invalid output name");
    }
    expect_true(threw, "path-like output name rejected");
}

// Files the generated code writes under vars/ itself are not declared outputs.
static void test_unlisted_files_ignored(const std::filesystem::path& dir) {
    const auto out = dir / "user";
    write_all(out / "vars" / "data.json", "[1, 2]");
    write_all(out / "vars" / "total.json", "{\"kind\":\"value\",\"name\":\"total\",\"value\":7}");

    VariableMap got = unmarshal_outputs(out, {"total"});
    expect_eq_ll((long long)got.size(), 1, "only the listed output decoded");
    expect_true(got.at("total") == Value::integer(7), "listed output value");
    expect_true(got.find("data") == got.end(), "user json file left alone");
    expect_eq_str(declared_output_path("total"), "vars/total.json", "declared output path");
}

static void test_describe_and_parse() {
    expect_eq_str(describe_variables({}), "No data variables available.", "empty description");
    std::string d = describe_variables({{"tips_data", sample_table()}, {"n", Value::integer(7)}});
    expect_true(contains(d, "Variable: tips_data"), "names the table");
    expect_true(contains(d, "Shape: (3, 3)"), "table shape: " + d);
    expect_true(contains(d, "Columns: ['total_bill', 'tip', 'day']"), "columns");
    expect_true(contains(d, "Sample data (first 3 rows):"), "sample rows");
    expect_true(contains(d, "Variable: n"), "names the scalar");

    json_util::Doc doc = json_util::parse(
        "{\"xs\":{\"kind\":\"value\",\"value\":[1,2.5,\"a\"]},"
        "\"df\":{\"kind\":\"table\",\"columns\":[\"a\"],\"data\":{\"a\":[1,null]}}}");
    VariableMap vars = variables_from_json(doc.root);
    expect_eq_ll((long long)vars.size(), 2, "two variables parsed");
    expect_true(vars.at("xs") == Value::list({Value::integer(1), Value::real(2.5), Value::string("a")}), "list parsed");
    expect_eq_ll((long long)vars.at("df").as_table().rows(), 2, "table rows");
}

int main() {
    auto dir = make_test_dir("marshal");
    test_names();
    test_unsupported_values();
    test_round_trip(dir / "rt");
    test_all_or_nothing(dir / "doomed");
    test_select_used();
    test_unmarshal_errors(dir);
    test_unlisted_files_ignored(dir);
    test_describe_and_parse();
    std::filesystem::remove_all(dir);
    std::cerr << "test_marshal: ALL PASSED" << std::endl;
    return 0;
}
