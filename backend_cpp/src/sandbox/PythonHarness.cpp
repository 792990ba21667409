#include "sandbox/PythonHarness.hpp"
#include <sstream>
#include <nlohmann/json.hpp>

namespace pyguard::sandbox {

using json = nlohmann::json;

const std::string& harness_source() {
    static const std::string source = R"PY(
import sys, os, json, linecache, traceback

CHANNEL = 3
BOOTSTRAP_EXIT = 86
VIOLATION_EXIT = 87

def emit(record):
    try:
        os.write(CHANNEL, (json.dumps(record) + "\n").encode("utf-8", "replace"))
    except OSError:
        pass

def flush_streams():
    for stream in (sys.stdout, sys.stderr):
        try:
            stream.flush()
        except (OSError, ValueError):
            pass

def report(exc):
    frames = [f for f in traceback.extract_tb(exc.__traceback__) if f.filename == "<fragment>"]
    line = frames[-1].lineno if frames else None
    if line is None and isinstance(exc, SyntaxError) and exc.filename == "<fragment>":
        line = exc.lineno
    try:
        message = str(exc)
    except BaseException:
        message = "<unprintable %s>" % type(exc).__name__
    formatted = ""
    if frames:
        formatted = "Traceback (most recent call last):\n" + "".join(traceback.format_list(frames))
    formatted += "".join(traceback.format_exception_only(type(exc), exc))
    emit({"kind": "exception", "type": type(exc).__name__, "message": message[:4000],
          "line": line, "frames": [{"line": f.lineno, "function": f.name} for f in frames],
          "formatted": formatted[-8000:]})

def install_policy(scratch, net_ok, fs_ok):
    # The hook only uses what is bound here, before the fragment can patch
    # builtins or modules, and everything it closes over is immutable.
    _type, _len, _str, _bytes, _int, _ord = type, len, str, bytes, int, ord
    _issubclass = issubclass
    _OSError, _ValueError, _TypeError = OSError, ValueError, TypeError
    _lstat, _readlink, _getcwd, _fspath = os.lstat, os.readlink, os.getcwd, os.fspath
    _write, _exit = os.write, os._exit
    _to_str, _decode = str.__str__, bytes.decode
    channel, violation_exit = CHANNEL, VIOLATION_EXIT
    sep = "/"

    def canonical(path):
        # realpath over C primitives; None for a symlink loop or an unusable path.
        if not path.startswith(sep):
            path = _getcwd() + sep + path
        pending = path.split(sep)
        pending.reverse()
        parts = []
        hops = 0
        while pending:
            part = pending.pop()
            if part == "" or part == ".":
                continue
            if part == "..":
                if parts:
                    parts.pop()
                continue
            candidate = sep + sep.join(parts) + sep + part if parts else sep + part
            try:
                mode = _lstat(candidate).st_mode
            except (_OSError, _ValueError):
                parts.append(part)
                continue
            if mode & 0o170000 != 0o120000:
                parts.append(part)
                continue
            hops += 1
            if hops > 40:
                return None
            try:
                target = _readlink(candidate)
            except (_OSError, _ValueError):
                return None
            if target.startswith(sep):
                parts = []
            extra = target.split(sep)
            extra.reverse()
            pending.extend(extra)
        return sep + sep.join(parts)

    def as_path(value):
        if value is None:
            return canonical(".")
        kind = _type(value)
        if not (_issubclass(kind, _str) or _issubclass(kind, _bytes)):
            if _issubclass(kind, _int):
                return False  # descriptor: checked when it was opened
            try:
                value = _fspath(value)
            except _TypeError:
                return None
            kind = _type(value)
        if _issubclass(kind, _bytes):
            value = _decode(value, "utf-8", "surrogateescape")
        elif _issubclass(kind, _str):
            value = _to_str(value)
        else:
            return None
        return canonical(value)

    scratch_root = canonical(scratch)
    scratch_prefix = scratch_root + sep
    roots = []
    for entry_path in sys.path:
        if not entry_path:
            continue
        p = canonical(entry_path)
        if p is None or p == scratch_root or p.startswith(scratch_prefix):
            continue
        roots.append(p.rstrip(sep) + sep)
    roots = tuple(roots)
    # Imports resolve from the interpreter roots only, never from the scratch area.
    sys.path[:] = [p for p in sys.path if p and (canonical(p) or "").rstrip(sep) + sep in roots]

    devices = frozenset(("/dev/null", "/dev/urandom", "/dev/random"))
    write_flags = os.O_WRONLY | os.O_RDWR | os.O_APPEND | os.O_CREAT | os.O_TRUNC
    blocked = frozenset((
        "subprocess.Popen", "os.system", "os.exec", "os.posix_spawn", "os.spawn",
        "os.fork", "os.forkpty", "pty.spawn", "os.kill", "os.killpg", "signal.pthread_kill",
        "ctypes.dlopen", "ctypes.dlsym", "ctypes.call_function",
        "os.chmod", "os.chown", "os.chflags", "os.link", "os.symlink", "os.startfile",
        "gc.get_objects", "gc.get_referrers", "gc.get_referents",
        "sys.settrace", "sys.setprofile", "sys.monitoring.register_callback",
    ))
    network = frozenset((
        "socket.connect", "socket.bind", "socket.sendto", "socket.sendmsg",
        "socket.getaddrinfo", "socket.gethostbyname", "socket.gethostbyname_ex",
        "socket.gethostbyaddr", "socket.getnameinfo", "urllib.Request",
        "http.client.connect", "ftplib.connect", "smtplib.connect", "poplib.connect",
        "imaplib.open", "nntplib.connect", "telnetlib.Telnet.open",
    ))
    fs_reads = frozenset(("os.listdir", "os.scandir", "glob.glob"))
    fs_writes = frozenset(("os.remove", "os.rename", "os.mkdir", "os.rmdir", "os.truncate", "os.utime",
                           "shutil.rmtree", "shutil.move", "shutil.copyfile", "shutil.copytree"))

    def quote(text):
        out = []
        for ch in text:
            code = _ord(ch)
            if ch == '"' or ch == "\\":
                out.append("\\" + ch)
            elif 0x20 <= code < 0x7F:
                out.append(ch)
            elif code <= 0xFFFF:
                out.append("\\u%04x" % code)
            else:
                out.append("?")
        return '"' + "".join(out) + '"'

    def violation(event, detail):
        try:
            record = '{"kind": "violation", "event": %s, "detail": %s}\n' % (quote(event), quote(detail))
            _write(channel, record.encode("ascii"))
        finally:
            _exit(violation_exit)

    def may_read(p):
        if p in devices or p.startswith(roots):
            return True
        return fs_ok and (p == scratch_root or p.startswith(scratch_prefix))

    def may_write(p):
        return p == "/dev/null" or (fs_ok and p.startswith(scratch_prefix))

    def hook(event, args):
        if event in blocked:
            violation(event, "process, signal, introspection or native-code escape")
        if not net_ok:
            if event in network:
                violation(event, "network access is disabled")
            if event == "socket.__new__" and _len(args) > 1 and args[1] in (2, 10, 17):
                violation(event, "network socket")
        if event == "open":
            p = as_path(args[0])
            if p is False:
                return
            if p is None:
                violation(event, "unresolvable path")
            flags = args[2] if _len(args) > 2 else None
            mode = args[1] if _len(args) > 1 else None
            if _type(flags) is _int:
                writing = (flags & write_flags) != 0
            elif _type(mode) is _str:
                writing = "w" in mode or "a" in mode or "x" in mode or "+" in mode
            else:
                writing = False
            if writing and not may_write(p):
                violation(event, "write to %s" % p)
            if not writing and not may_read(p):
                violation(event, "read of %s" % p)
        elif event == "os.chdir" or (event in fs_reads and _len(args) > 0):
            p = as_path(args[0])
            if p is None or (p is not False and not may_read(p)):
                violation(event, "access to %s" % p)
        elif event in fs_writes:
            for arg in args[:2]:
                if arg is None or _type(arg) is _int:
                    continue
                p = as_path(arg)
                if p is None or (p is not False and not may_write(p)):
                    violation(event, "write to %s" % p)

    sys.addaudithook(hook)
    return scratch_root

def main():
    scratch, net_ok, fs_ok, entry = sys.argv[1], sys.argv[2] == "1", sys.argv[3] == "1", sys.argv[4]
    try:
        with open(os.path.join(scratch, "fragment.py"), "rb") as fh:
            source = fh.read()
    except OSError as exc:
        os.write(2, ("pyguard harness: cannot load fragment: %s\n" % exc).encode())
        os._exit(BOOTSTRAP_EXIT)

    text = source.decode("utf-8", "replace")
    linecache.cache["<fragment>"] = (len(text), None, text.splitlines(True), "<fragment>")
    os.chdir(scratch)
    install_policy(scratch, net_ok, fs_ok)
    emit({"kind": "ready"})

    status = 0
    try:
        code = compile(source, "<fragment>", "exec")
        namespace = {"__name__": "__main__", "__builtins__": __builtins__}
        exec(code, namespace)
        if entry:
            fn = namespace.get(entry)
            if not callable(fn):
                raise NameError("entry point %r is not defined" % entry)
            fn()
    except SystemExit as exc:
        if exc.code is None:
            status = 0
        elif isinstance(exc.code, int):
            status = exc.code & 0xFF
        else:
            print(exc.code, file=sys.stderr)
            status = 1
    except BaseException as exc:
        try:
            report(exc)
        except BaseException:
            emit({"kind": "exception", "type": type(exc).__name__, "message": "",
                  "line": None, "frames": [], "formatted": ""})
        status = 1
    flush_streams()
    os._exit(status)

main()
)PY";
    return source;
}

std::vector<std::string> harness_arguments(const std::string& scratch,
                                           bool network_allowed,
                                           bool filesystem_allowed,
                                           const std::optional<std::string>& entry_point) {
    return {
        scratch,
        network_allowed ? "1" : "0",
        filesystem_allowed ? "1" : "0",
        entry_point.value_or("")
    };
}

namespace {

ExceptionTrace parse_exception(const json& j) {
    ExceptionTrace trace;
    trace.type = j.value("type", "Exception");
    trace.message = j.value("message", "");
    trace.formatted = j.value("formatted", "");
    if (j.contains("line") && j["line"].is_number_integer()) trace.line = j["line"].get<int>();

    if (j.contains("frames") && j["frames"].is_array()) {
        for (const auto& f : j["frames"]) {
            if (!f.is_object()) continue;
            TraceFrame frame;
            frame.line = f.contains("line") && f["line"].is_number_integer() ? f["line"].get<int>() : 0;
            frame.function = f.value("function", "");
            trace.frames.push_back(std::move(frame));
        }
    }
    return trace;
}

}

HarnessReport parse_channel(const std::string& data) {
    HarnessReport report;
    std::istringstream stream(data);
    std::string line;

    while (std::getline(stream, line)) {
        if (line.empty()) continue;
        json record = json::parse(line, nullptr, false);
        if (record.is_discarded() || !record.is_object()) continue;

        try {
            std::string kind = record.value("kind", "");
            if (kind == "ready") {
                report.ready = true;
            } else if (kind == "exception" && !report.exception) {
                report.exception = parse_exception(record);
            } else if (kind == "violation" && !report.violation) {
                report.violation = record.value("event", "unknown") + ": " + record.value("detail", "");
            }
        } catch (const json::exception&) {
            continue; // Wrong field types: the record is unusable
        }
    }
    return report;
}

}
