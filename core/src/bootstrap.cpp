#include "codeloop/bootstrap.h"
#include "codeloop/errors.h"

#include <fstream>

namespace codeloop {

namespace {

const char* kPrelude = R"PY(# codeloop sandbox bootstrap. Generated code runs inside _main().
import json
import math
import os
import sys
import traceback

INPUT_DIR = os.environ.get("CODELOOP_INPUT_DIR") or "/inputs"
OUTPUT_DIR = os.environ.get("CODELOOP_OUTPUT_DIR") or "/outputs"
_RESULT = os.path.join(OUTPUT_DIR, "_result.json")
_OUT_VARS = os.path.join(OUTPUT_DIR, "vars")
_declared = []


def _decode(env):
    if env.get("kind") == "table":
        cols = env.get("columns", [])
        data = env.get("data", {})
        try:
            import pandas as pd
        except ImportError:
            return {c: list(data[c]) for c in cols}
        return pd.DataFrame({c: data[c] for c in cols}, columns=cols)
    return env.get("value")


def _plain(v, path, nan_as_none=False):
    if v is None or isinstance(v, (bool, str)):
        return v
    if isinstance(v, int):
        if not (-(2 ** 63) <= v < 2 ** 63):
            raise TypeError(f"{path}: integer outside int64 range")
        return v
    if isinstance(v, float):
        if not math.isfinite(v):
            if nan_as_none and math.isnan(v):
                return None
            raise TypeError(f"{path}: non-finite float has no transfer form")
        return v
    if getattr(v, "shape", None) == () and callable(getattr(v, "item", None)):
        return _plain(v.item(), path, nan_as_none)
    if isinstance(v, dict):
        out = {}
        for k, x in v.items():
            if not isinstance(k, str):
                raise TypeError(f"{path}: dict keys must be str, got {type(k).__name__}")
            out[k] = _plain(x, f"{path}.{k}", nan_as_none)
        return out
    if isinstance(v, (list, tuple)):
        return [_plain(x, f"{path}[{i}]", nan_as_none) for i, x in enumerate(v)]
    if callable(getattr(v, "tolist", None)):
        return _plain(v.tolist(), path, nan_as_none)
    raise TypeError(f"{path}: {type(v).__name__} has no transfer form")


def _encode(name, value):
    try:
        import pandas as pd
    except ImportError:
        pd = None
    if pd is not None and isinstance(value, pd.DataFrame):
        cols = [str(c) for c in value.columns]
        if len(set(cols)) != len(cols):
            raise TypeError(f"{name}: duplicate column names")
        data = {}
        for col, src in zip(cols, value.columns):
            cells = [_plain(x, f"{name}.{col}", True) for x in value[src].tolist()]
            for i, cell in enumerate(cells):
                if isinstance(cell, (list, dict)):
                    raise TypeError(f"{name}.{col}[{i}]: table cells must be scalars")
            data[col] = cells
        return {"kind": "table", "name": name, "columns": cols, "data": data}
    return {"kind": "value", "name": name, "value": _plain(value, name)}


def emit(name, value):
    """Declare value as an output variable the host reads back after the run."""
    if not isinstance(name, str) or not name.isidentifier():
        raise ValueError(f"emit: invalid output name {name!r}")
    env = _encode(name, value)
    os.makedirs(_OUT_VARS, exist_ok=True)
    tmp = os.path.join(_OUT_VARS, f".{name}.tmp")
    with open(tmp, "w", encoding="utf-8") as f:
        json.dump(env, f, allow_nan=False)
    os.replace(tmp, os.path.join(_OUT_VARS, f"{name}.json"))
    if name not in _declared:
        _declared.append(name)


def _load_inputs(ns):
    with open(os.path.join(INPUT_DIR, "manifest.json"), encoding="utf-8") as f:
        manifest = json.load(f)
    for item in manifest.get("variables", []):
        with open(os.path.join(INPUT_DIR, item["file"]), encoding="utf-8") as f:
            ns[item["name"]] = _decode(json.load(f))


def _relax_permissions():
    # files created as root must stay removable by the host user
    for root, dirs, files in os.walk(OUTPUT_DIR):
        for n in dirs + files:
            try:
                os.chmod(os.path.join(root, n), 0o777)
            except OSError:
                pass


def _main():
    ns = {"__name__": "__main__", "emit": emit, "INPUT_DIR": INPUT_DIR, "OUTPUT_DIR": OUTPUT_DIR}
    summary = {"status": "ok", "exit_code": 0, "exception_type": "", "exception_message": ""}
    try:
        _load_inputs(ns)
        with open(os.path.join(INPUT_DIR, "code.py"), encoding="utf-8") as f:
            source = f.read()
        exec(compile(source, "<generated>", "exec"), ns)
    except SystemExit as e:
        code = e.code
        if code is None:
            code = 0
        elif not isinstance(code, int):
            print(code, file=sys.stderr)
            code = 1
        summary["exit_code"] = code
        if code != 0:
            summary.update(status="raised", exception_type="SystemExit", exception_message=str(e.code))
    except BaseException as e:
        traceback.print_exception(type(e), e, e.__traceback__.tb_next)
        summary.update(status="raised", exit_code=1,
                       exception_type=type(e).__name__, exception_message=str(e))
    finally:
        sys.stdout.flush()
        sys.stderr.flush()
        summary["outputs"] = list(_declared)
        try:
            with open(_RESULT + ".tmp", "w", encoding="utf-8") as f:
                json.dump(summary, f)
            os.replace(_RESULT + ".tmp", _RESULT)
        except OSError as e:
            print(f"bootstrap: cannot write result summary: {e}", file=sys.stderr)
        _relax_permissions()
    return summary["exit_code"]


if __name__ == "__main__":
    sys.exit(_main())
)PY";

void write_text(const std::filesystem::path& p, const std::string& body) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) throw EnvironmentCreateFailed("cannot open " + p.string() + " for writing");
    f.write(body.data(), (std::streamsize)body.size());
    if (!f) throw EnvironmentCreateFailed("short write to " + p.string());
}

} // namespace

const std::string& bootstrap_source() {
    static const std::string src(kPrelude);
    return src;
}

void write_bootstrap(const std::filesystem::path& input_dir, const std::string& code) {
    write_text(input_dir / kBootstrapFile, bootstrap_source());
    // generated code is data: it is only ever read by the bootstrap
    write_text(input_dir / kCodeFile, code);
}

} // namespace codeloop
