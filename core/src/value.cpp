#include "codeloop/value.h"

namespace codeloop {

static const ValueList kEmptyList;
static const ValueMap kEmptyMap;
static const Table kEmptyTable;

Value Value::boolean(bool b) {
    Value v; v.kind_ = Kind::BOOL; v.b_ = b;
    return v;
}

Value Value::integer(int64_t i) {
    Value v; v.kind_ = Kind::INT; v.i_ = i;
    return v;
}

Value Value::real(double d) {
    Value v; v.kind_ = Kind::DOUBLE; v.d_ = d;
    return v;
}

Value Value::string(std::string s) {
    Value v; v.kind_ = Kind::STRING; v.s_ = std::move(s);
    return v;
}

Value Value::list(ValueList items) {
    Value v; v.kind_ = Kind::LIST;
    v.list_ = std::make_shared<const ValueList>(std::move(items));
    return v;
}

Value Value::map(ValueMap items) {
    Value v; v.kind_ = Kind::MAP;
    v.map_ = std::make_shared<const ValueMap>(std::move(items));
    return v;
}

Value Value::table(Table t) {
    Value v; v.kind_ = Kind::TABLE;
    v.table_ = std::make_shared<const Table>(std::move(t));
    return v;
}

Value Value::opaque(std::string type_name) {
    Value v; v.kind_ = Kind::OPAQUE; v.s_ = std::move(type_name);
    return v;
}

size_t Table::rows() const { return data.empty() ? 0 : data[0].size(); }

bool Value::is_scalar() const {
    switch (kind_) {
        case Kind::NUL:
        case Kind::BOOL:
        case Kind::INT:
        case Kind::DOUBLE:
        case Kind::STRING:
            return true;
        default:
            return false;
    }
}

const ValueList& Value::as_list() const { return list_ ? *list_ : kEmptyList; }
const ValueMap& Value::as_map() const { return map_ ? *map_ : kEmptyMap; }
const Table& Value::as_table() const { return table_ ? *table_ : kEmptyTable; }

bool Value::operator==(const Value& o) const {
    if (kind_ != o.kind_) return false;
    switch (kind_) {
        case Kind::NUL: return true;
        case Kind::BOOL: return b_ == o.b_;
        case Kind::INT: return i_ == o.i_;
        case Kind::DOUBLE: return d_ == o.d_;
        case Kind::STRING:
        case Kind::OPAQUE:
            return s_ == o.s_;
        case Kind::LIST: return as_list() == o.as_list();
        case Kind::MAP: return as_map() == o.as_map();
        case Kind::TABLE: {
            const Table& a = as_table();
            const Table& b = o.as_table();
            return a.columns == b.columns && a.data == b.data;
        }
    }
    return false;
}

const char* value_kind_name(Value::Kind k) {
    switch (k) {
        case Value::Kind::NUL: return "null";
        case Value::Kind::BOOL: return "bool";
        case Value::Kind::INT: return "int";
        case Value::Kind::DOUBLE: return "double";
        case Value::Kind::STRING: return "string";
        case Value::Kind::LIST: return "list";
        case Value::Kind::MAP: return "map";
        case Value::Kind::TABLE: return "table";
        case Value::Kind::OPAQUE: return "opaque";
    }
    return "unknown";
}

} // namespace codeloop
