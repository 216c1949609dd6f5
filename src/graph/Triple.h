#pragma once
#include <string>
#include <tuple>

namespace bacnet_scan {

namespace vocab {
constexpr const char* kRdfType = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
constexpr const char* kRdfsLabel = "http://www.w3.org/2000/01/rdf-schema#label";
constexpr const char* kBacnetNs = "http://data.ashrae.org/bacnet/2020#";
constexpr const char* kXsdInteger = "http://www.w3.org/2001/XMLSchema#integer";

inline std::string bacnet(const std::string& local){ return std::string(kBacnetNs) + local; }
}

struct Term {
    enum class Kind { Iri, String, Integer };
    Kind kind = Kind::Iri;
    std::string value; // integer literals keep their lexical form

    static Term iri(std::string v){ return Term{Kind::Iri, std::move(v)}; }
    static Term string(std::string v){ return Term{Kind::String, std::move(v)}; }
    static Term integer(long long v){ return Term{Kind::Integer, std::to_string(v)}; }

    bool operator==(const Term& o) const { return kind == o.kind && value == o.value; }
    bool operator<(const Term& o) const { return std::tie(kind, value) < std::tie(o.kind, o.value); }
};

struct Triple {
    std::string subject;   // IRI
    std::string predicate; // IRI
    Term object;

    bool operator==(const Triple& o) const { return subject == o.subject && predicate == o.predicate && object == o.object; }
    bool operator!=(const Triple& o) const { return !(*this == o); }
    bool operator<(const Triple& o) const { return std::tie(subject, predicate, object) < std::tie(o.subject, o.predicate, o.object); }
};

}
