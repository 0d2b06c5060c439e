#include "DnsMessage.hpp"

#include <cctype>
#include <cstdio>

namespace mdns_reflector
{
  namespace dns
  {

    namespace
    {
      // Compression pointers followed while reading one name.
      constexpr int MAX_POINTER_HOPS = 64;

      inline uint16_t rd16(const uint8_t *p) { return (uint16_t(p[0]) << 8) | p[1]; }
      inline uint32_t rd32(const uint8_t *p) { return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | p[3]; }

      inline void wr16(std::vector<uint8_t> &out, uint16_t v)
      {
        out.push_back(uint8_t(v >> 8));
        out.push_back(uint8_t(v));
      }

      inline void wr32(std::vector<uint8_t> &out, uint32_t v)
      {
        out.push_back(uint8_t(v >> 24));
        out.push_back(uint8_t(v >> 16));
        out.push_back(uint8_t(v >> 8));
        out.push_back(uint8_t(v));
      }

      // Reads a possibly compressed name starting at off. On success off is
      // advanced past the name as it appears in place (pointer targets are
      // not counted).
      bool read_name(const uint8_t *buf, size_t len, size_t &off, DnsName &out)
      {
        out.labels.clear();
        size_t pos = off;
        size_t wire = 1;
        int hops = 0;
        bool jumped = false;
        while (pos < len)
        {
          uint8_t lab = buf[pos++];
          if (lab == 0)
          {
            if (!jumped)
              off = pos;
            return true;
          }
          if ((lab & 0xC0) == 0xC0)
          {
            if (pos >= len)
              return false;
            uint16_t ptr = uint16_t((lab & 0x3F) << 8) | buf[pos++];
            if (ptr >= len || ++hops > MAX_POINTER_HOPS)
              return false;
            if (!jumped)
            {
              off = pos;
              jumped = true;
            }
            pos = ptr;
            continue;
          }
          if ((lab & 0xC0) != 0)
            return false; // extended label types are not used by mDNS
          if (pos + lab > len)
            return false;
          wire += size_t(lab) + 1;
          if (wire > MAX_NAME)
            return false;
          out.labels.emplace_back(reinterpret_cast<const char *>(buf + pos), lab);
          pos += lab;
        }
        return false;
      }

      bool write_name(std::vector<uint8_t> &out, const DnsName &name)
      {
        size_t wire = 1;
        for (const auto &label : name.labels)
        {
          if (label.empty() || label.size() > MAX_LABEL)
            return false;
          wire += label.size() + 1;
          if (wire > MAX_NAME)
            return false;
          out.push_back(uint8_t(label.size()));
          out.insert(out.end(), label.begin(), label.end());
        }
        out.push_back(0);
        return true;
      }

      // Copies rdata, expanding the names of record types that may carry
      // compression pointers.
      bool read_rdata(const uint8_t *buf, size_t len, size_t rdoff, size_t next,
                      uint16_t type, std::vector<uint8_t> &out)
      {
        size_t prefix = 0;
        int names = 0;
        switch (type)
        {
        case T_PTR:
        case T_CNAME:
        case T_NS:
        case T_DNAME:
        case T_NSEC: // next domain name; the type bitmap follows verbatim
          names = 1;
          break;
        case T_RP:
          names = 2; // mbox, txt
          break;
        case T_AFSDB:
        case T_RT:
        case T_KX:
          prefix = 2; // subtype / preference
          names = 1;
          break;
        case T_PX:
          prefix = 2; // preference; map822, mapx400
          names = 2;
          break;
        case T_SRV:
          prefix = 6; // priority, weight, port
          names = 1;
          break;
        case T_MX:
          prefix = 2; // preference
          names = 1;
          break;
        case T_SOA:
          names = 2; // mname, rname; serial..minimum follow verbatim
          break;
        default:
          break;
        }

        if (names == 0)
        {
          out.assign(buf + rdoff, buf + next);
          return true;
        }
        if (rdoff + prefix > next)
          return false;

        out.assign(buf + rdoff, buf + rdoff + prefix);
        size_t p = rdoff + prefix;
        for (int i = 0; i < names; ++i)
        {
          DnsName n;
          if (!read_name(buf, len, p, n) || p > next)
            return false;
          if (!write_name(out, n))
            return false;
        }
        out.insert(out.end(), buf + p, buf + next);
        return true;
      }

      bool read_records(const uint8_t *buf, size_t len, size_t &off, uint16_t count,
                        std::vector<ResourceRecord> &out)
      {
        for (uint16_t i = 0; i < count; ++i)
        {
          ResourceRecord rr;
          if (!read_name(buf, len, off, rr.name))
            return false;
          if (off + 10 > len)
            return false;
          rr.type = rd16(buf + off);
          rr.klass = rd16(buf + off + 2);
          rr.ttl = rd32(buf + off + 4);
          uint16_t rdlen = rd16(buf + off + 8);
          size_t rdoff = off + 10;
          size_t next = rdoff + rdlen;
          if (next > len)
            return false;
          if (!read_rdata(buf, len, rdoff, next, rr.type, rr.rdata))
            return false;
          off = next;
          out.push_back(std::move(rr));
        }
        return true;
      }

      bool write_records(std::vector<uint8_t> &out, const std::vector<ResourceRecord> &records)
      {
        for (const auto &rr : records)
        {
          if (rr.rdata.size() > 0xFFFF)
            return false;
          if (!write_name(out, rr.name))
            return false;
          wr16(out, rr.type);
          wr16(out, rr.klass);
          wr32(out, rr.ttl);
          wr16(out, uint16_t(rr.rdata.size()));
          out.insert(out.end(), rr.rdata.begin(), rr.rdata.end());
        }
        return true;
      }
    } // namespace

    std::string typeName(uint16_t type)
    {
      switch (type)
      {
      case T_A:
        return "A";
      case T_NS:
        return "NS";
      case T_CNAME:
        return "CNAME";
      case T_SOA:
        return "SOA";
      case T_PTR:
        return "PTR";
      case T_HINFO:
        return "HINFO";
      case T_MX:
        return "MX";
      case T_TXT:
        return "TXT";
      case T_AAAA:
        return "AAAA";
      case T_SRV:
        return "SRV";
      case T_DNAME:
        return "DNAME";
      case T_NSEC:
        return "NSEC";
      case T_ANY:
        return "ANY";
      default:
        return "TYPE" + std::to_string(type);
      }
    }

    std::string DnsName::toString() const
    {
      if (labels.empty())
        return ".";
      std::string out;
      for (const auto &label : labels)
      {
        for (unsigned char c : label)
        {
          if (c == '.' || c == '\\')
          {
            out.push_back('\\');
            out.push_back(char(c));
          }
          else if (c < 0x20 || c > 0x7E)
          {
            char esc[5];
            std::snprintf(esc, sizeof(esc), "\\%03u", unsigned(c));
            out += esc;
          }
          else
          {
            out.push_back(char(c));
          }
        }
        out.push_back('.');
      }
      return out;
    }

    DnsName DnsName::fromString(const std::string &text)
    {
      DnsName name;
      std::string label;
      for (size_t i = 0; i < text.size(); ++i)
      {
        char c = text[i];
        if (c == '\\' && i + 1 < text.size())
        {
          if (i + 3 < text.size() && std::isdigit((unsigned char)text[i + 1]) &&
              std::isdigit((unsigned char)text[i + 2]) && std::isdigit((unsigned char)text[i + 3]))
          {
            label.push_back(char(std::stoi(text.substr(i + 1, 3))));
            i += 3;
          }
          else
          {
            label.push_back(text[++i]);
          }
        }
        else if (c == '.')
        {
          if (!label.empty())
            name.labels.push_back(label);
          label.clear();
        }
        else
        {
          label.push_back(c);
        }
      }
      if (!label.empty())
        name.labels.push_back(label);
      return name;
    }

    std::optional<DnsMessage> DnsMessage::decode(const uint8_t *data, size_t len)
    {
      if (data == nullptr || len < HEADER_SIZE)
        return std::nullopt;

      DnsMessage m;
      m.id = rd16(data);
      m.flags = rd16(data + 2);
      const uint16_t qdcount = rd16(data + 4);
      const uint16_t ancount = rd16(data + 6);
      const uint16_t nscount = rd16(data + 8);
      const uint16_t arcount = rd16(data + 10);

      size_t off = HEADER_SIZE;
      for (uint16_t i = 0; i < qdcount; ++i)
      {
        Question q;
        if (!read_name(data, len, off, q.name))
          return std::nullopt;
        if (off + 4 > len)
          return std::nullopt;
        q.type = rd16(data + off);
        q.klass = rd16(data + off + 2);
        off += 4;
        m.questions.push_back(std::move(q));
      }

      if (!read_records(data, len, off, ancount, m.answers) ||
          !read_records(data, len, off, nscount, m.authorities) ||
          !read_records(data, len, off, arcount, m.additionals))
        return std::nullopt;

      return m;
    }

    std::optional<std::vector<uint8_t>> DnsMessage::encode() const
    {
      if (questions.size() > 0xFFFF || answers.size() > 0xFFFF ||
          authorities.size() > 0xFFFF || additionals.size() > 0xFFFF)
        return std::nullopt;

      std::vector<uint8_t> out;
      out.reserve(512);
      wr16(out, id);
      wr16(out, flags);
      wr16(out, uint16_t(questions.size()));
      wr16(out, uint16_t(answers.size()));
      wr16(out, uint16_t(authorities.size()));
      wr16(out, uint16_t(additionals.size()));

      for (const auto &q : questions)
      {
        if (!write_name(out, q.name))
          return std::nullopt;
        wr16(out, q.type);
        wr16(out, q.klass);
      }

      if (!write_records(out, answers) || !write_records(out, authorities) ||
          !write_records(out, additionals))
        return std::nullopt;

      return out;
    }

  } // namespace dns
} // namespace mdns_reflector
