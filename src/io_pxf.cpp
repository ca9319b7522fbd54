// ============================================================================
//  File: src/io_pxf.cpp — Conteneur fichier .pxf
// ============================================================================

#include "io_pxf.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

namespace {

struct File {
    FILE* f=nullptr;
    ~File(){ if(f) std::fclose(f); }
    bool open(const std::string& p, const char* mode){ f=std::fopen(p.c_str(), mode); return f!=nullptr; }
};

void put_u16(std::vector<uint8_t>& b, uint16_t v)
{
    b.push_back((uint8_t)(v & 0xFF));
    b.push_back((uint8_t)(v >> 8));
}
void put_u32(std::vector<uint8_t>& b, uint32_t v)
{
    for(int i=0; i<4; ++i) b.push_back((uint8_t)(v >> (8*i)));
}
uint32_t get_u32(const uint8_t* p)
{
    return (uint32_t)p[0] | ((uint32_t)p[1]<<8) | ((uint32_t)p[2]<<16) | ((uint32_t)p[3]<<24);
}
bool write_bytes(FILE* f, const void* p, size_t n)
{
    return n==0 || std::fwrite(p, 1, n, f)==n;
}
bool read_bytes(FILE* f, void* p, size_t n)
{
    return n==0 || std::fread(p, 1, n, f)==n;
}
void set_err(std::string* e, const char* msg)
{
    if(e) *e = msg;
}

// Champs couverts par le CRC d'en-tête : ver, size, reserved, meta_len, payload_len
std::vector<uint8_t> header_fields(uint8_t ver, uint8_t size, uint16_t reserved,
                                   uint32_t meta_len, uint32_t payload_len)
{
    std::vector<uint8_t> b;
    b.reserve(12);
    b.push_back(ver);
    b.push_back(size);
    put_u16(b, reserved);
    put_u32(b, meta_len);
    put_u32(b, payload_len);
    return b;
}

} // namespace

namespace PxfContainer {

uint32_t crc32(const void* data, size_t n)
{
    static uint32_t table[256];
    static bool init=false;
    if(!init)
    {
        for(uint32_t i=0; i<256; ++i)
        {
            uint32_t c=i;
            for(int k=0; k<8; ++k) c = (c&1)? (0xEDB88320u ^ (c>>1)) : (c>>1);
            table[i]=c;
        }
        init=true;
    }
    uint32_t c=0xFFFFFFFFu;
    const uint8_t* p=(const uint8_t*)data;
    for(size_t i=0; i<n; ++i) c = table[(c ^ p[i]) & 0xFFu] ^ (c >> 8);
    return c ^ 0xFFFFFFFFu;
}

bool pxf_write(const std::string& path,
               const pxf::PixelFrame& frame,
               const std::string& meta_json,
               std::string* err)
{
    File fp;
    if(!fp.open(path, "wb"))
    {
        if(err) *err = std::string("pxf: ") + std::strerror(errno);
        return false;
    }

    const std::vector<uint8_t>& payload = frame.raw_bytes();
    const std::vector<uint8_t> fields = header_fields(kVersion, frame.size(), 0,
                                                      (uint32_t)meta_json.size(),
                                                      (uint32_t)payload.size());
    const uint8_t magic[4] = {'P','X','F','1'};
    std::vector<uint8_t> head(magic, magic+4);
    head.insert(head.end(), fields.begin(), fields.end());
    put_u32(head, crc32(fields.data(), fields.size()));

    std::vector<uint8_t> tail;
    put_u32(tail, crc32(payload.data(), payload.size()));

    if(!write_bytes(fp.f, head.data(), head.size()) ||
       !write_bytes(fp.f, meta_json.data(), meta_json.size()) ||
       !write_bytes(fp.f, payload.data(), payload.size()) ||
       !write_bytes(fp.f, tail.data(), tail.size()))
    {
        set_err(err, "pxf: I/O error");
        return false;
    }
    return true;
}

bool pxf_read(const std::string& path,
              pxf::PixelFrame& out_frame,
              std::string* out_meta_json,
              std::string* err)
{
    File fp;
    if(!fp.open(path, "rb"))
    {
        if(err) *err = std::string("pxf: ") + std::strerror(errno);
        return false;
    }

    uint8_t head[20];
    if(!read_bytes(fp.f, head, sizeof(head)))
    {
        set_err(err, "pxf: truncated header");
        return false;
    }
    if(std::memcmp(head, "PXF1", 4)!=0)
    {
        set_err(err, "pxf: bad magic");
        return false;
    }
    const uint8_t ver = head[4];
    const uint8_t size = head[5];
    const uint32_t meta_len = get_u32(head+8);
    const uint32_t payload_len = get_u32(head+12);
    const uint32_t hdr_crc = get_u32(head+16);

    if(crc32(head+4, 12)!=hdr_crc)
    {
        set_err(err, "pxf: header crc mismatch");
        return false;
    }
    if(ver!=kVersion)
    {
        set_err(err, "pxf: unsupported version");
        return false;
    }
    if(payload_len!=pxf::PixelFrame::bytes_for(size))
    {
        set_err(err, "pxf: payload length does not match frame size");
        return false;
    }

    std::string meta(meta_len, '\0');
    if(!read_bytes(fp.f, &meta[0], meta_len))
    {
        set_err(err, "pxf: truncated meta");
        return false;
    }
    std::vector<uint8_t> payload(payload_len);
    uint8_t crc_buf[4];
    if(!read_bytes(fp.f, payload.data(), payload.size()) || !read_bytes(fp.f, crc_buf, 4))
    {
        set_err(err, "pxf: truncated payload");
        return false;
    }
    if(crc32(payload.data(), payload.size())!=get_u32(crc_buf))
    {
        set_err(err, "pxf: payload crc mismatch");
        return false;
    }

    const pxf::Status s = pxf::PixelFrame::from_raw(size, payload, out_frame);
    if(!pxf::ok(s))
    {
        set_err(err, pxf::status_name(s));
        return false;
    }
    if(out_meta_json) out_meta_json->swap(meta);
    return true;
}

std::string json_escape(const std::string& s)
{
    static const char* hex = "0123456789abcdef";
    std::string o;
    o.reserve(s.size());
    for(char ch : s)
    {
        const unsigned char c = (unsigned char)ch;
        switch(c)
        {
        case '"':  o += "\\\""; break;
        case '\\': o += "\\\\"; break;
        case '\n': o += "\\n"; break;
        case '\r': o += "\\r"; break;
        case '\t': o += "\\t"; break;
        case '\b': o += "\\b"; break;
        case '\f': o += "\\f"; break;
        default:
            if(c<0x20)
            {
                o += "\\u00";
                o.push_back(hex[c>>4]);
                o.push_back(hex[c&0xF]);
            }
            else o.push_back(ch);
        }
    }
    return o;
}

std::string meta_make(const std::string& title)
{
    return "{\"title\":\"" + json_escape(title) + "\"}";
}

bool meta_find_str(const std::string& js, const std::string& key, std::string& out)
{
    size_t p = js.find("\""+key+"\"");
    if(p==std::string::npos) return false;
    p = js.find(':', p);
    if(p==std::string::npos) return false;
    p = js.find('"', p);
    if(p==std::string::npos) return false;
    std::string v;
    for(++p; p<js.size(); ++p)
    {
        const char c = js[p];
        if(c=='"')
        {
            out.swap(v);
            return true;
        }
        if(c!='\\')
        {
            v.push_back(c);
            continue;
        }
        if(++p>=js.size()) return false;
        switch(js[p])
        {
        case 'n': v.push_back('\n'); break;
        case 'r': v.push_back('\r'); break;
        case 't': v.push_back('\t'); break;
        case 'b': v.push_back('\b'); break;
        case 'f': v.push_back('\f'); break;
        case 'u':
        {
            // séquence u00XX seulement (méta écrite par json_escape)
            if(p+4>=js.size()) return false;
            unsigned cp=0;
            for(int k=1; k<=4; ++k)
            {
                const char h = js[p+k];
                cp <<= 4;
                if(h>='0' && h<='9') cp |= (unsigned)(h-'0');
                else if(h>='a' && h<='f') cp |= (unsigned)(h-'a'+10);
                else if(h>='A' && h<='F') cp |= (unsigned)(h-'A'+10);
                else return false;
            }
            if(cp>0xFF) return false;
            v.push_back((char)cp);
            p += 4;
            break;
        }
        default: v.push_back(js[p]); break;
        }
    }
    return false;
}

} // namespace PxfContainer
