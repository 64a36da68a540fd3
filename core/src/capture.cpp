#include "codeloop/capture.h"
#include "codeloop/bootstrap.h"
#include "codeloop/errors.h"
#include "codeloop/json_util.h"
#include "codeloop/marshal.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace codeloop {

namespace {

bool read_file(const std::filesystem::path& p, std::string* out) {
    std::ifstream f(p, std::ios::binary);
    if (!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) return false;
    *out = ss.str();
    return true;
}

void read_summary(const std::filesystem::path& output_dir, CapturedResult* r) {
    const auto p = output_dir / kResultFile;
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) return;

    std::string body;
    if (!read_file(p, &body)) throw CaptureFailed("cannot read result summary " + p.string());
    json_util::Doc doc = json_util::parse(body);
    if (!doc || !json_object_is_type(doc.root, json_type_object)) {
        throw CaptureFailed("result summary is not a JSON object");
    }
    r->summary_present = true;
    r->exception_type = json_util::get_string(doc.root, "exception_type").value_or("");
    r->exception_message = json_util::get_string(doc.root, "exception_message").value_or("");

    r->declared_outputs = unmarshal_outputs(output_dir, json_util::get_string_array(doc.root, "outputs"));
}

// emit() stages each output as vars/.<name>.tmp before renaming it.
bool is_emit_staging_file(const std::filesystem::path& rel) {
    const std::string base = rel.filename().string();
    return rel.parent_path().generic_string() == "vars" && base.size() > 5 && base[0] == '.' &&
           base.compare(base.size() - 4, 4, ".tmp") == 0;
}

void read_output_files(const std::filesystem::path& output_dir, CapturedResult* r) {
    std::error_code ec;
    if (!std::filesystem::is_directory(output_dir, ec)) return;

    std::vector<std::filesystem::path> files;
    std::filesystem::recursive_directory_iterator it(output_dir, ec), end;
    if (ec) throw CaptureFailed("cannot list output mount: " + ec.message());
    for (; it != end; it.increment(ec)) {
        if (ec) throw CaptureFailed("cannot list output mount: " + ec.message());
        const auto rel = std::filesystem::relative(it->path(), output_dir, ec);
        if (ec) throw CaptureFailed("cannot list output mount: " + ec.message());
        const std::string first = rel.begin() == rel.end() ? "" : rel.begin()->string();
        if (first == kResultFile || first == std::string(kResultFile) + ".tmp") continue;
        if (!it->is_regular_file(ec)) continue;
        // declared outputs are returned decoded, not as files
        const std::string generic = rel.generic_string();
        bool declared = false;
        for (const auto& kv : r->declared_outputs) {
            if (generic == declared_output_path(kv.first)) { declared = true; break; }
        }
        if (declared || is_emit_staging_file(rel)) continue;
        files.push_back(rel);
    }
    std::sort(files.begin(), files.end());

    for (const auto& rel : files) {
        OutputFile f;
        f.path = rel.generic_string();
        if (!read_file(output_dir / rel, &f.bytes)) {
            throw CaptureFailed("cannot read output file " + f.path);
        }
        r->output_files.push_back(std::move(f));
    }
}

} // namespace

bool detect_mount_write_violation(const std::string& stderr_text) {
    std::istringstream in(stderr_text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.find("Read-only file system") != std::string::npos) return true;
        if (line.find("Permission denied") != std::string::npos &&
            line.find(kInputMount) != std::string::npos) return true;
    }
    return false;
}

CapturedResult capture_result(const RawExecutionRecord& rec, const std::filesystem::path& output_dir) {
    if (rec.io_error) {
        throw CaptureFailed("output stream read failed for " + rec.instance_name + ": " + rec.io_error_detail);
    }

    CapturedResult r;
    r.stdout_text = rec.stdout_text;
    r.stderr_text = rec.stderr_text;
    r.exit_status = rec.exit_status;
    r.timed_out = rec.timed_out;
    r.duration_ms = rec.duration_ms;
    r.mount_write_violation = detect_mount_write_violation(rec.stderr_text);

    if (rec.timed_out) return r;

    read_summary(output_dir, &r);
    if (!r.summary_present && rec.exit_status == 0) {
        // the bootstrap reports its own failure to write the summary
        if (rec.stderr_text.find(kSummaryWriteFailed) != std::string::npos) {
            throw CaptureFailed(rec.instance_name + " could not write its result summary");
        }
        // the generated code left the process before the bootstrap could finish
        r.exited_without_summary = true;
    }
    read_output_files(output_dir, &r);
    return r;
}

} // namespace codeloop
