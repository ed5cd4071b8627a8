#include "discovery/MdnsPacket.hpp"
#include <algorithm>
#include <cctype>

namespace keylightd::mdns {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string strip_dot(std::string s) {
    while (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

static void put16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

std::vector<uint8_t> build_query(const std::string& service, uint16_t id) {
    std::vector<uint8_t> out;
    put16(out, id);
    put16(out, 0);      // flags: standard query
    put16(out, 1);      // qdcount
    put16(out, 0);
    put16(out, 0);
    put16(out, 0);

    std::string name = strip_dot(service);
    size_t start = 0;
    while (start <= name.size()) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos) dot = name.size();
        size_t n = std::min<size_t>(dot - start, 63);
        if (n > 0) {
            out.push_back(static_cast<uint8_t>(n));
            out.insert(out.end(), name.begin() + start, name.begin() + start + n);
        }
        start = dot + 1;
    }
    out.push_back(0);
    put16(out, TYPE_PTR);
    put16(out, CLASS_IN | CLASS_QU);
    return out;
}

namespace {

class Reader {
public:
    Reader(const uint8_t* data, std::size_t len) : data_(data), len_(len) {}

    bool u16(std::size_t& pos, uint16_t& v) const {
        if (pos + 2 > len_) return false;
        v = static_cast<uint16_t>((data_[pos] << 8) | data_[pos + 1]);
        pos += 2;
        return true;
    }

    bool u32(std::size_t& pos, uint32_t& v) const {
        uint16_t hi = 0, lo = 0;
        if (!u16(pos, hi) || !u16(pos, lo)) return false;
        v = (static_cast<uint32_t>(hi) << 16) | lo;
        return true;
    }

    // Reads a possibly compressed name starting at `pos`; advances `pos`
    // past the name as it appears in place.
    bool name(std::size_t& pos, std::string& out) const {
        out.clear();
        std::size_t cur = pos;
        bool jumped = false;
        int jumps = 0;
        for (;;) {
            if (cur >= len_) return false;
            uint8_t n = data_[cur];
            if ((n & 0xC0) == 0xC0) {
                if (cur + 1 >= len_) return false;
                std::size_t target = (static_cast<std::size_t>(n & 0x3F) << 8) | data_[cur + 1];
                if (!jumped) pos = cur + 2;
                jumped = true;
                if (++jumps > 32 || target >= len_) return false;
                cur = target;
                continue;
            }
            if (n & 0xC0) return false; // reserved label types
            cur += 1;
            if (n == 0) break;
            if (cur + n > len_) return false;
            if (!out.empty()) out.push_back('.');
            out.append(reinterpret_cast<const char*>(data_ + cur), n);
            cur += n;
            if (out.size() > 255) return false;
        }
        if (!jumped) pos = cur;
        out = lower(out);
        return true;
    }

    const uint8_t* at(std::size_t pos) const { return data_ + pos; }
    std::size_t size() const { return len_; }

private:
    const uint8_t* data_;
    std::size_t len_;
};

} // namespace

std::optional<Message> parse(const uint8_t* data, std::size_t len) {
    Reader r(data, len);
    std::size_t pos = 0;
    uint16_t flags = 0, qd = 0, an = 0, ns = 0, ar = 0;
    Message msg;
    if (!r.u16(pos, msg.id) || !r.u16(pos, flags) || !r.u16(pos, qd) ||
        !r.u16(pos, an) || !r.u16(pos, ns) || !r.u16(pos, ar)) {
        return std::nullopt;
    }
    msg.is_response = (flags & 0x8000) != 0;

    std::string name;
    for (int i = 0; i < qd; ++i) {
        uint16_t qtype = 0, qclass = 0;
        if (!r.name(pos, name) || !r.u16(pos, qtype) || !r.u16(pos, qclass)) return std::nullopt;
    }

    const int records = an + ns + ar;
    for (int i = 0; i < records; ++i) {
        uint16_t type = 0, cls = 0, rdlen = 0;
        uint32_t ttl = 0;
        if (!r.name(pos, name) || !r.u16(pos, type) || !r.u16(pos, cls) || !r.u32(pos, ttl) || !r.u16(pos, rdlen)) {
            return std::nullopt;
        }
        const std::size_t rdata = pos;
        const std::size_t end = pos + rdlen;
        if (end > r.size()) return std::nullopt;

        switch (type) {
        case TYPE_PTR: {
            std::size_t p = rdata;
            std::string target;
            if (!r.name(p, target)) return std::nullopt;
            msg.ptr.emplace(name, target);
            break;
        }
        case TYPE_SRV: {
            std::size_t p = rdata;
            uint16_t prio = 0, weight = 0, port = 0;
            SrvRecord srv;
            if (!r.u16(p, prio) || !r.u16(p, weight) || !r.u16(p, port) || !r.name(p, srv.target)) return std::nullopt;
            srv.port = port;
            msg.srv[name] = srv;
            break;
        }
        case TYPE_TXT: {
            auto& kv = msg.txt[name];
            std::size_t p = rdata;
            while (p < end) {
                uint8_t n = *r.at(p);
                p += 1;
                if (p + n > end) return std::nullopt;
                std::string entry(reinterpret_cast<const char*>(r.at(p)), n);
                p += n;
                if (entry.empty()) continue;
                auto eq = entry.find('=');
                if (eq == std::string::npos) kv[lower(entry)] = "";
                else kv[lower(entry.substr(0, eq))] = entry.substr(eq + 1);
            }
            break;
        }
        case TYPE_A: {
            if (rdlen != 4) return std::nullopt;
            const uint8_t* b = r.at(rdata);
            msg.a[name] = std::to_string(b[0]) + "." + std::to_string(b[1]) + "." +
                          std::to_string(b[2]) + "." + std::to_string(b[3]);
            break;
        }
        default:
            break; // AAAA, NSEC, ... ignored
        }
        pos = end;
    }
    return msg;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<Observation> to_observations(const Message& msg, const std::string& service, const std::string& sender) {
    const std::string svc = lower(strip_dot(service));

    // Instances come from PTR answers, or from SRV records announced on their own.
    std::vector<std::string> instances;
    auto range = msg.ptr.equal_range(svc);
    for (auto it = range.first; it != range.second; ++it) instances.push_back(it->second);
    for (const auto& [inst, _] : msg.srv) {
        if (ends_with(inst, "." + svc) && std::find(instances.begin(), instances.end(), inst) == instances.end()) {
            instances.push_back(inst);
        }
    }

    std::vector<Observation> out;
    for (const auto& inst : instances) {
        auto srv = msg.srv.find(inst);
        if (srv == msg.srv.end()) continue; // no port, cannot address it

        Observation obs;
        obs.source = "mdns";
        obs.address.port = srv->second.port;
        auto a = msg.a.find(srv->second.target);
        obs.address.host = (a != msg.a.end()) ? a->second : sender;
        if (obs.address.host.empty()) continue;

        // Instance label, e.g. "elgato key light 1a2b"
        std::string label = inst;
        if (ends_with(label, "." + svc)) label = label.substr(0, label.size() - svc.size() - 1);
        obs.name = label;

        auto txt = msg.txt.find(inst);
        if (txt != msg.txt.end()) {
            auto id = txt->second.find("id");
            if (id != txt->second.end() && !id->second.empty()) obs.id = normalize_device_id(id->second);
            auto md = txt->second.find("md");
            if (md != txt->second.end()) obs.model = md->second;
        }
        if (obs.id.empty()) obs.id = normalize_device_id(label);
        out.push_back(std::move(obs));
    }
    return out;
}

} // namespace keylightd::mdns
