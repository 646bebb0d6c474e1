#include "imp/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace imp {

std::string json_escape(const std::string& s){
    std::string out;
    out.reserve(s.size()+2);
    out+='"';
    for(char c: s){
        switch(c){
            case '"': out+="\\\""; break;
            case '\\': out+="\\\\"; break;
            case '\n': out+="\\n"; break;
            case '\r': out+="\\r"; break;
            case '\t': out+="\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){
                    char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X",(unsigned)(unsigned char)c); out+=buf;
                } else out+=c;
        }
    }
    out+='"';
    return out;
}

static void append_diagnostic(std::ostringstream& os, const Diagnostic& d){
    os<<"{\"code\":"<<json_escape(d.code)
      <<",\"message\":"<<json_escape(d.message)
      <<",\"line\":"<<d.line
      <<",\"col\":"<<d.col<<"}";
}

std::string diagnostics_to_json(const DiagnosticReport& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false");
    if(!r.file.empty()) os<<",\"file\":"<<json_escape(r.file);
    os<<",\"errors\":[";
    for(size_t i=0;i<r.errors.size(); ++i){
        if(i) os<<",";
        append_diagnostic(os, r.errors[i]);
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const DiagnosticReport& r, bool enabled){
    if(!enabled) return;
    std::fprintf(stderr, "%s\n", diagnostics_to_json(r).c_str());
}

} // namespace imp
