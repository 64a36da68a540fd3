#include "codeloop/log.h"
#include "codeloop/json_util.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace codeloop {

namespace {

std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            out << json_util::quote(keys[i]) << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_util::to_string_plain(obj);
        break;
    }
}

} // namespace

std::string canonical_json(const std::string& raw) {
    json_util::Doc d = json_util::parse(raw);
    if (!d) return raw;
    std::ostringstream out;
    canonical_serialize(d.root, out);
    return out.str();
}

JsonlEventSink::JsonlEventSink(const RunHeader& hdr, const std::string& path)
    : hdr_(hdr), path_(path), out_(path, std::ios::out | std::ios::app) {
    if (!out_) throw std::runtime_error("cannot open event log: " + path);
}

void JsonlEventSink::event(int step, const std::string& name, const std::string& payload_json) {
    json_util::Doc rec(json_object_new_object());
    json_object_object_add(rec.root, "event", json_util::new_string(name));

    json_util::Doc payload = json_util::parse(payload_json);
    json_object_object_add(rec.root, "payload",
                           payload ? payload.release() : json_util::new_string(payload_json));

    if (!hdr_.request_id.empty())
        json_object_object_add(rec.root, "request_id", json_util::new_string(hdr_.request_id));
    json_object_object_add(rec.root, "run_id", json_util::new_string(hdr_.run_id));
    json_object_object_add(rec.root, "spec_version", json_util::new_string(hdr_.spec_version));
    json_object_object_add(rec.root, "step", json_object_new_int(step));
    json_object_object_add(rec.root, "ts", json_util::new_string(iso_now()));

    std::ostringstream line;
    canonical_serialize(rec.root, line);

    std::lock_guard<std::mutex> lk(mu_);
    out_ << line.str() << "\n";
    out_.flush();
}

void StderrEventSink::event(int step, const std::string& name, const std::string& payload_json) {
    std::lock_guard<std::mutex> lk(mu_);
    std::cerr << "[codeloop] " << name << " step=" << step << " " << canonical_json(payload_json) << "\n";
}

void TeeEventSink::event(int step, const std::string& name, const std::string& payload_json) {
    for (auto* s : sinks_) {
        if (s) s->event(step, name, payload_json);
    }
}

} // namespace codeloop
