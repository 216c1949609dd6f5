#include "JsonUtil.h"
#include <cstdio>
#include <ctime>

namespace bacnet_scan {
namespace jsonutil {

std::string escape(const std::string& s){
    std::string out; out.reserve(s.size() + 8);
    for(unsigned char c : s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if(c < 0x20){ char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", c); out += buf; }
                else out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

static bool utc_tm(std::chrono::system_clock::time_point tp, std::tm& out){
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    return gmtime_r(&t, &out) != nullptr;
}

std::string time_to_iso(std::chrono::system_clock::time_point tp){
    std::tm tm{}; if(!utc_tm(tp, tm)) return "";
    char buf[32]; std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string time_to_stamp(std::chrono::system_clock::time_point tp){
    std::tm tm{}; if(!utc_tm(tp, tm)) return "";
    char buf[32]; std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

}
}
