#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace codeloop {

class Value;

using ValueList = std::vector<Value>;
using ValueMap = std::map<std::string, Value>;

// Named host variables handed to a workflow. Keys are the names the
// generated code sees.
using VariableMap = std::map<std::string, Value>;

// Column-oriented table. Every column holds the same number of scalar values.
struct Table {
    std::vector<std::string> columns;
    std::vector<ValueList> data; // data[i] belongs to columns[i]

    size_t rows() const;
};

// Immutable tagged value. Compound payloads are shared, never mutated.
class Value {
public:
    enum class Kind { NUL, BOOL, INT, DOUBLE, STRING, LIST, MAP, TABLE, OPAQUE };

    Value() = default;

    static Value null() { return Value(); }
    static Value boolean(bool b);
    static Value integer(int64_t i);
    static Value real(double d);
    static Value string(std::string s);
    static Value list(ValueList items);
    static Value map(ValueMap items);
    static Value table(Table t);
    // A host object with no transfer form (handles, callbacks, ...).
    static Value opaque(std::string type_name);

    Kind kind() const { return kind_; }
    bool is_scalar() const;

    bool as_bool() const { return b_; }
    int64_t as_int() const { return i_; }
    double as_double() const { return d_; }
    const std::string& as_string() const { return s_; } // also the opaque type name
    const ValueList& as_list() const;
    const ValueMap& as_map() const;
    const Table& as_table() const;

    bool operator==(const Value& o) const;
    bool operator!=(const Value& o) const { return !(*this == o); }

private:
    Kind kind_{Kind::NUL};
    bool b_{false};
    int64_t i_{0};
    double d_{0.0};
    std::string s_;
    std::shared_ptr<const ValueList> list_;
    std::shared_ptr<const ValueMap> map_;
    std::shared_ptr<const Table> table_;
};

const char* value_kind_name(Value::Kind k);

} // namespace codeloop
