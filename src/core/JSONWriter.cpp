#include "JSONWriter.h"
#include "JsonUtil.h"
#include "BuildInfo.h"
#include "../graph/GraphSerializer.h"
#include <chrono>
#include <map>
#include <sstream>
#include <vector>

namespace bacnet_scan {
namespace {

    struct CanonVal {
        enum Type { T_OBJ, T_ARR, T_STR, T_NUM } type = T_OBJ;
        std::map<std::string, CanonVal> obj;
        std::vector<CanonVal> arr;
        std::string str; // for string & number token text
        CanonVal() = default;
        explicit CanonVal(Type t): type(t) {}
    };

    static void canon_emit(const CanonVal& v, std::ostream& os);

    using jsonutil::escape; using jsonutil::time_to_iso;

    static CanonVal str_val(const std::string& s){ CanonVal v{CanonVal::T_STR}; v.str = s; return v; }
    static CanonVal num_val(long long n){ CanonVal v{CanonVal::T_NUM}; v.str = std::to_string(n); return v; }
    static CanonVal bool_val(bool b){ CanonVal v{CanonVal::T_NUM}; v.str = b ? "true" : "false"; return v; }

    static void emit_array(const CanonVal& v, std::ostream& os) {
        os << '[';
        bool first = true;
        for (const auto& e : v.arr) {
            if (!first) os << ',';
            first = false;
            canon_emit(e, os);
        }
        os << ']';
    }

    static void emit_object(const CanonVal& v, std::ostream& os) {
        os << '{';
        bool first = true;
        for (const auto& kv : v.obj) {
            if (!first) os << ',';
            first = false;
            os << '"' << escape(kv.first) << '"' << ':';
            canon_emit(kv.second, os);
        }
        os << '}';
    }

    static void canon_emit(const CanonVal& v, std::ostream& os) {
        switch (v.type) {
            case CanonVal::T_STR: os << '"' << escape(v.str) << '"'; break;
            case CanonVal::T_NUM: os << v.str; break;
            case CanonVal::T_ARR: emit_array(v, os); break;
            case CanonVal::T_OBJ: emit_object(v, os); break;
        }
    }

    static std::string pretty_print_json(const std::string& compact_json) {
        std::string out;
        out.reserve(compact_json.size() * 2);
        int depth = 0;
        bool in_string = false;
        bool esc = false;
        auto indent = [&](int d) {
            for (int i = 0; i < d; i++) out.append("  ");
        };
        for (char c : compact_json) {
            out.push_back(c);
            if (esc) { esc = false; continue; }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { in_string = !in_string; continue; }
            if (in_string) continue;
            switch (c) {
                case '{':
                case '[':
                    out.push_back('\n');
                    indent(++depth);
                    break;
                case '}':
                case ']':
                    out.push_back('\n');
                    if (--depth < 0) depth = 0;
                    indent(depth);
                    break;
                case ',':
                    out.push_back('\n');
                    indent(depth);
                    break;
                case ':':
                    out.push_back(' ');
                    break;
                default:
                    break;
            }
        }
        out.push_back('\n');
        return out;
    }

    static std::string render(const CanonVal& root, const Config& cfg) {
        std::ostringstream os;
        canon_emit(root, os);
        return cfg.pretty ? pretty_print_json(os.str()) : os.str();
    }

    static CanonVal node_object(const TopologyNode& n) {
        CanonVal o{CanonVal::T_OBJ};
        o.obj["id"] = str_val(n.key());
        o.obj["type"] = str_val(type_tag(n.type()));
        if (n.label()) o.obj["label"] = str_val(*n.label());
        if (n.device_instance()) o.obj["device_instance"] = num_val(*n.device_instance());
        if (n.address()) o.obj["address"] = str_val(*n.address());
        if (n.vendor_id()) o.obj["vendor_id"] = str_val(node_key::vendor(*n.vendor_id()));
        return o;
    }

    static void put_graph(CanonVal& root, const TopologyGraph& graph) {
        CanonVal nodes{CanonVal::T_ARR};
        CanonVal edges{CanonVal::T_ARR};
        std::map<std::string, long long> type_counts;
        std::map<std::string, long long> relation_counts;
        for (const auto& kv : graph.nodes()) {
            const auto& n = kv.second;
            nodes.arr.push_back(node_object(n));
            type_counts[type_tag(n.type())]++;
            for (const auto& r : n.relations()) {
                CanonVal e{CanonVal::T_OBJ};
                e.obj["source"] = str_val(n.key());
                e.obj["predicate"] = str_val(predicate_name(r.first));
                e.obj["target"] = str_val(r.second);
                edges.arr.push_back(std::move(e));
                relation_counts[predicate_name(r.first)]++;
            }
        }
        root.obj["nodes"] = std::move(nodes);
        root.obj["edges"] = std::move(edges);

        CanonVal summary{CanonVal::T_OBJ};
        summary.obj["node_count"] = num_val(static_cast<long long>(graph.node_count()));
        summary.obj["relation_count"] = num_val(static_cast<long long>(graph.relation_count()));
        CanonVal by_type{CanonVal::T_OBJ};
        for (const auto& kv : type_counts) by_type.obj[kv.first] = num_val(kv.second);
        CanonVal by_rel{CanonVal::T_OBJ};
        for (const auto& kv : relation_counts) by_rel.obj[kv.first] = num_val(kv.second);
        summary.obj["node_types"] = std::move(by_type);
        summary.obj["relations"] = std::move(by_rel);
        root.obj["summary"] = std::move(summary);
    }

    static CanonVal build_meta(const TopologyGraph& graph) {
        CanonVal meta{CanonVal::T_OBJ};
        meta.obj["tool_version"] = str_val(buildinfo::APP_VERSION);
        meta.obj["git_commit"] = str_val(buildinfo::GIT_COMMIT);
        meta.obj["generated_at"] = str_val(time_to_iso(std::chrono::system_clock::now()));
        meta.obj["graph_digest"] = str_val(ntriples::digest(graph.to_triples()));
        return meta;
    }

    static CanonVal side_channel(const std::vector<std::pair<std::string,std::string>>& items) {
        CanonVal arr{CanonVal::T_ARR};
        for (const auto& w : items) {
            CanonVal o{CanonVal::T_OBJ};
            o.obj["phase"] = str_val(w.first);
            o.obj["message"] = str_val(w.second);
            arr.arr.push_back(std::move(o));
        }
        return arr;
    }

    static CanonVal triple_array(const std::vector<Triple>& triples) {
        CanonVal arr{CanonVal::T_ARR};
        for (const auto& t : triples) {
            CanonVal o{CanonVal::T_OBJ};
            o.obj["subject"] = str_val(t.subject);
            o.obj["predicate"] = str_val(t.predicate);
            o.obj["object"] = str_val(t.object.value);
            o.obj["object_kind"] = str_val(t.object.kind == Term::Kind::Iri ? "iri" : t.object.kind == Term::Kind::Integer ? "integer" : "string");
            arr.arr.push_back(std::move(o));
        }
        return arr;
    }

} // namespace

std::string JSONWriter::write_graph(const TopologyGraph& graph, const Config& cfg) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta(graph);
    put_graph(root, graph);
    return render(root, cfg);
}

std::string JSONWriter::write(const Report& report, const TopologyGraph& graph, const Config& cfg) const {
    CanonVal root{CanonVal::T_OBJ};
    CanonVal meta = build_meta(graph);
    meta.obj["local_name"] = str_val(cfg.local_name);
    meta.obj["local_instance"] = num_val(cfg.local_instance_id);
    meta.obj["low_limit"] = num_val(cfg.low_limit);
    meta.obj["high_limit"] = num_val(cfg.high_limit);
    meta.obj["probe_bbmds"] = bool_val(cfg.probe_bbmds);
    root.obj["meta"] = std::move(meta);
    put_graph(root, graph);

    CanonVal phases{CanonVal::T_ARR};
    std::chrono::system_clock::time_point earliest{}, latest{};
    for (const auto& r : report.results()) {
        CanonVal p{CanonVal::T_OBJ};
        p.obj["name"] = str_val(r.scanner_name);
        p.obj["start_time"] = str_val(time_to_iso(r.start_time));
        p.obj["end_time"] = str_val(time_to_iso(r.end_time));
        long long ms = r.end_time >= r.start_time ? std::chrono::duration_cast<std::chrono::milliseconds>(r.end_time - r.start_time).count() : 0;
        p.obj["duration_ms"] = num_val(ms);
        CanonVal counters{CanonVal::T_OBJ};
        for (const auto& kv : r.counters) counters.obj[kv.first] = num_val(kv.second);
        p.obj["counters"] = std::move(counters);
        phases.arr.push_back(std::move(p));
        if (earliest.time_since_epoch().count() == 0 || r.start_time < earliest) earliest = r.start_time;
        if (r.end_time > latest) latest = r.end_time;
    }
    root.obj["phases"] = std::move(phases);
    auto warnings = report.warnings();
    auto errors = report.errors();
    root.obj["warnings"] = side_channel(warnings);
    root.obj["errors"] = side_channel(errors);
    auto& summary = root.obj["summary"];
    summary.obj["warning_count"] = num_val(static_cast<long long>(warnings.size()));
    summary.obj["error_count"] = num_val(static_cast<long long>(errors.size()));
    long long duration_ms = 0;
    if (earliest.time_since_epoch().count() && latest >= earliest) {
        duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(latest - earliest).count();
    }
    summary.obj["duration_ms"] = num_val(duration_ms);
    return render(root, cfg);
}

std::string JSONWriter::write_diff(const DiffResult& diff, const std::string& source_a, const std::string& source_b, const Config& cfg) const {
    CanonVal root{CanonVal::T_OBJ};
    CanonVal meta{CanonVal::T_OBJ};
    meta.obj["source_a"] = str_val(source_a);
    meta.obj["source_b"] = str_val(source_b);
    meta.obj["digest_a"] = str_val(diff.digest_a);
    meta.obj["digest_b"] = str_val(diff.digest_b);
    meta.obj["identical"] = bool_val(diff.identical());
    root.obj["meta"] = std::move(meta);
    CanonVal summary{CanonVal::T_OBJ};
    summary.obj["in_both"] = num_val(static_cast<long long>(diff.in_both.size()));
    summary.obj["only_in_a"] = num_val(static_cast<long long>(diff.only_in_a.size()));
    summary.obj["only_in_b"] = num_val(static_cast<long long>(diff.only_in_b.size()));
    root.obj["summary"] = std::move(summary);
    root.obj["only_in_a"] = triple_array(diff.only_in_a);
    root.obj["only_in_b"] = triple_array(diff.only_in_b);
    return render(root, cfg);
}

}
