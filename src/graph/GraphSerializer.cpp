#include "GraphSerializer.h"
#include "../core/Digest.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace bacnet_scan {

GraphParseError::GraphParseError(size_t line, const std::string& msg)
    : std::runtime_error(line ? "line " + std::to_string(line) + ": " + msg : msg), line_(line) {}

namespace ntriples {

namespace {

std::string escape_literal(const std::string& s){
    std::string out; out.reserve(s.size() + 2);
    for(unsigned char c : s){
        switch(c){
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if(c < 0x20){ char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04X", c); out += buf; }
                else out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

// Characters the IRI grammar forbids go out as \uXXXX, which parse() decodes.
std::string escape_iri(const std::string& s){
    std::string out; out.reserve(s.size());
    for(unsigned char c : s){
        if(c <= 0x20 || c == '<' || c == '>' || c == '"' || c == '{' || c == '}' || c == '|' || c == '^' || c == '`' || c == '\\'){
            char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04X", c); out += buf;
        } else out.push_back(static_cast<char>(c));
    }
    return out;
}

void append_utf8(std::string& out, unsigned long cp){
    if(cp < 0x80) out.push_back(static_cast<char>(cp));
    else if(cp < 0x800){ out.push_back(static_cast<char>(0xC0 | (cp >> 6))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
    else if(cp < 0x10000){ out.push_back(static_cast<char>(0xE0 | (cp >> 12))); out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
    else { out.push_back(static_cast<char>(0xF0 | (cp >> 18))); out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F))); out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
}

class LineParser {
public:
    LineParser(const std::string& line, size_t lineno) : s_(line), line_(lineno) {}

    Triple parse(){
        Triple t;
        t.subject = iri();
        ws();
        t.predicate = iri();
        ws();
        t.object = object();
        ws();
        expect('.');
        ws();
        if(pos_ < s_.size() && s_[pos_] != '#') fail("trailing characters after '.'");
        return t;
    }

private:
    [[noreturn]] void fail(const std::string& msg) const { throw GraphParseError(line_, msg); }

    void ws(){ while(pos_ < s_.size() && (s_[pos_] == ' ' || s_[pos_] == '\t')) ++pos_; }

    void expect(char c){
        if(pos_ >= s_.size() || s_[pos_] != c) fail(std::string("expected '") + c + "'");
        ++pos_;
    }

    unsigned long hex(size_t digits){
        if(pos_ + digits > s_.size()) fail("truncated escape");
        unsigned long v = 0;
        for(size_t i = 0; i < digits; ++i){
            char c = s_[pos_++];
            v <<= 4;
            if(c >= '0' && c <= '9') v |= static_cast<unsigned long>(c - '0');
            else if(c >= 'a' && c <= 'f') v |= static_cast<unsigned long>(c - 'a' + 10);
            else if(c >= 'A' && c <= 'F') v |= static_cast<unsigned long>(c - 'A' + 10);
            else fail("bad hex digit in escape");
        }
        if(v > 0x10FFFF) fail("code point out of range");
        return v;
    }

    std::string iri(){
        expect('<');
        std::string out;
        while(true){
            if(pos_ >= s_.size()) fail("unterminated IRI");
            char c = s_[pos_++];
            if(c == '>') break;
            if(c == '\\'){
                if(pos_ >= s_.size()) fail("truncated escape");
                char e = s_[pos_++];
                if(e == 'u') append_utf8(out, hex(4));
                else if(e == 'U') append_utf8(out, hex(8));
                else fail("invalid IRI escape");
                continue;
            }
            if(static_cast<unsigned char>(c) <= 0x20 || c == '<' || c == '"' || c == '{' || c == '}' || c == '|' || c == '^' || c == '`') fail("invalid character in IRI");
            out.push_back(c);
        }
        if(out.empty()) fail("empty IRI");
        return out;
    }

    std::string literal(){
        expect('"');
        std::string out;
        while(true){
            if(pos_ >= s_.size()) fail("unterminated string literal");
            char c = s_[pos_++];
            if(c == '"') break;
            if(c != '\\'){ out.push_back(c); continue; }
            if(pos_ >= s_.size()) fail("truncated escape");
            char e = s_[pos_++];
            switch(e){
                case 't': out.push_back('\t'); break;
                case 'b': out.push_back('\b'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 'f': out.push_back('\f'); break;
                case '"': out.push_back('"'); break;
                case '\'': out.push_back('\''); break;
                case '\\': out.push_back('\\'); break;
                case 'u': append_utf8(out, hex(4)); break;
                case 'U': append_utf8(out, hex(8)); break;
                default: fail("invalid string escape");
            }
        }
        return out;
    }

    Term object(){
        if(pos_ < s_.size() && s_[pos_] == '<') return Term::iri(iri());
        if(pos_ < s_.size() && s_[pos_] == '_') fail("blank nodes are not supported");
        std::string value = literal();
        if(pos_ < s_.size() && s_[pos_] == '@'){
            ++pos_;
            size_t start = pos_;
            while(pos_ < s_.size() && (std::isalnum(static_cast<unsigned char>(s_[pos_])) || s_[pos_] == '-')) ++pos_;
            if(pos_ == start) fail("empty language tag");
            return Term::string(value);
        }
        if(pos_ + 1 < s_.size() && s_[pos_] == '^' && s_[pos_ + 1] == '^'){
            pos_ += 2;
            std::string dt = iri();
            if(dt == vocab::kXsdInteger){
                Term t; t.kind = Term::Kind::Integer; t.value = value;
                size_t i = (!value.empty() && (value[0] == '-' || value[0] == '+')) ? 1 : 0;
                if(i >= value.size()) fail("empty integer literal");
                for(; i < value.size(); ++i) if(!std::isdigit(static_cast<unsigned char>(value[i]))) fail("malformed integer literal");
                return t;
            }
            if(dt != "http://www.w3.org/2001/XMLSchema#string") fail("unsupported datatype " + dt);
        }
        return Term::string(value);
    }

    const std::string& s_;
    size_t line_;
    size_t pos_ = 0;
};

}

std::string format_triple(const Triple& t){
    std::string out = "<" + escape_iri(t.subject) + "> <" + escape_iri(t.predicate) + "> ";
    switch(t.object.kind){
        case Term::Kind::Iri: out += "<" + escape_iri(t.object.value) + ">"; break;
        case Term::Kind::String: out += "\"" + escape_literal(t.object.value) + "\""; break;
        case Term::Kind::Integer: out += "\"" + t.object.value + "\"^^<" + vocab::kXsdInteger + ">"; break;
    }
    out += " .";
    return out;
}

std::vector<std::string> canonical_lines(const std::vector<Triple>& triples){
    std::vector<std::string> lines;
    lines.reserve(triples.size());
    for(const auto& t : triples) lines.push_back(format_triple(t));
    std::sort(lines.begin(), lines.end());
    lines.erase(std::unique(lines.begin(), lines.end()), lines.end());
    return lines;
}

std::string write(const std::vector<Triple>& triples){
    std::string out;
    for(const auto& l : canonical_lines(triples)){ out += l; out.push_back('\n'); }
    return out;
}

std::string write(const TopologyGraph& graph){ return write(graph.to_triples()); }

std::vector<Triple> parse(const std::string& text){
    std::vector<Triple> out;
    std::istringstream is(text);
    std::string line; size_t lineno = 0;
    while(std::getline(is, line)){
        ++lineno;
        if(!line.empty() && line.back() == '\r') line.pop_back();
        size_t first = line.find_first_not_of(" \t");
        if(first == std::string::npos || line[first] == '#') continue;
        LineParser p(line.substr(first), lineno);
        out.push_back(p.parse());
    }
    return out;
}

std::vector<Triple> load_file(const std::string& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) throw GraphParseError(0, "cannot open graph file " + path);
    std::ostringstream ss; ss << in.rdbuf();
    if(in.bad()) throw GraphParseError(0, "error reading graph file " + path);
    return parse(ss.str());
}

TopologyGraph load_graph(const std::string& path){
    auto triples = load_file(path);
    try {
        return TopologyGraph::from_triples(triples);
    } catch(const GraphError& ex){
        throw GraphParseError(0, path + ": " + ex.what());
    }
}

void save_file(const std::string& path, const std::vector<Triple>& triples){
    // Write to a sibling temp file and rename so readers never see a partial graph.
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if(!out) throw std::runtime_error("cannot write graph file " + tmp);
        out << write(triples);
        out.flush();
        if(!out) throw std::runtime_error("error writing graph file " + tmp);
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if(ec){
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("cannot move graph file into place: " + path);
    }
}

std::string digest(const std::vector<Triple>& triples){
    return sha256_hex(write(triples));
}

}

}
