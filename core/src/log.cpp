#include "evosynth/log.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace evosynth {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Recursively serialize JSON with sorted keys so that equal events produce
// byte-identical lines.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
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
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
            json_object_put(ks);
            out << ":";
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
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonicalize_json(const std::string& raw) {
    json_object* obj = json_tokener_parse(raw.c_str());
    if (!obj) return raw;
    std::ostringstream out;
    canonical_serialize(obj, out);
    json_object_put(obj);
    return out.str();
}

std::string gen_run_id() {
    const char* det = std::getenv("EVOSYNTH_DETERMINISTIC_RUN_ID");

    uint64_t seed = 0;
    if (det && std::string(det) == "1") {
        seed = 1234567ULL;
    } else {
        uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
        uint64_t r = 0;
        try {
            std::random_device rd;
            r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
        } catch (const std::exception&) {
            r = 0x9e3779b97f4a7c15ULL;
        }
        seed = t ^ r;
    }

    std::mt19937_64 rng{seed};
    uint64_t a = rng();
    uint64_t b = rng();
    std::ostringstream oss;
    oss << std::hex << a << b;
    return oss.str();
}

JsonlLogger::JsonlLogger(const std::string& run_id, const std::string& path)
    : run_id_(run_id), out_(path, std::ios::out | std::ios::trunc) {
    if (!out_) throw std::runtime_error("JsonlLogger: cannot open " + path);
}

void JsonlLogger::event(int step, const std::string& name, const std::string& payload_json) {
    json_object* line = json_object_new_object();
    json_object_object_add(line, "event", json_object_new_string(name.c_str()));

    json_object* pobj = json_tokener_parse(payload_json.c_str());
    json_object_object_add(line, "payload", pobj ? pobj : json_object_new_string(payload_json.c_str()));

    json_object_object_add(line, "run_id", json_object_new_string(run_id_.c_str()));
    json_object_object_add(line, "step", json_object_new_int(step));
    json_object_object_add(line, "ts", json_object_new_string(iso_now().c_str()));

    std::ostringstream line_out;
    canonical_serialize(line, line_out);
    json_object_put(line);

    out_ << line_out.str() << "\n";
    out_.flush();
}

} // namespace evosynth
