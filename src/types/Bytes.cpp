/**
 * @file Bytes.cpp
 * @brief Implementation of the Bytes and String decoders.
 */

#include "binform/types/Bytes.hpp"
#include "binform/Errors.hpp"
#include "utils/Logging.hpp"
#include "utils/TextCodec.hpp"

namespace binform
{
namespace
{
    ByteString sentinelBytes(const Termination& termination)
    {
        if (!termination.sentinel) return {};

        const Value& s = *termination.sentinel;
        ByteString out;
        if (s.isBytes())
        {
            out = s.asBytes();
        }
        else if (s.isText())
        {
            out.assign(s.asText().begin(), s.asText().end());
        }
        else
        {
            throw InvalidConfiguration("bytes sentinel must be a byte string, got " + s.toString());
        }

        if (out.empty())
        {
            throw InvalidConfiguration("bytes sentinel must not be empty");
        }
        return out;
    }

    TextEncoding checkedEncoding(const std::string& name)
    {
        auto encoding = parseEncoding(name);
        if (!encoding)
        {
            throw InvalidConfiguration("unknown text encoding '" + name + "'");
        }
        return *encoding;
    }

} // namespace

    // --- Bytes ---

    Bytes::Bytes(Termination termination, FieldOptions options)
        : FieldDescriptor(std::move(options)), m_termination(std::move(termination))
    {
        m_termination.validate("bytes");
        m_sentinel = sentinelBytes(m_termination);
    }

    Value Bytes::decode(ByteSource& source, const Context& context, ByteOrder /*inherited*/) const
    {
        return Value(decodeRaw(source, context));
    }

    ByteString Bytes::decodeRaw(ByteSource& source, const Context& context) const
    {
        if (m_termination.count)
        {
            return source.readExact(m_termination.count->resolve(context));
        }
        if (m_termination.byteBudget)
        {
            return source.readExact(m_termination.byteBudget->resolve(context));
        }

        // Sentinel: compare whole windows, keep the terminator in the output.
        const std::size_t start = source.position();
        const std::size_t window = m_sentinel.size();
        ByteString result;
        ByteString chunk(window);
        while (true)
        {
            source.readFully(chunk.data(), window);
            result.insert(result.end(), chunk.begin(), chunk.end());
            if (chunk == m_sentinel) break;
        }

        BINFORM_LOG_DEBUG("bytes: sentinel found after {} byte(s) from offset {}", result.size(), start);
        return result;
    }

    // --- String ---

    String::String(Termination termination, std::string encoding, FieldOptions options)
        : FieldDescriptor(std::move(options)),
          m_bytes(std::move(termination)),
          m_encoding(std::move(encoding)),
          m_codec(checkedEncoding(m_encoding))
    {
    }

    Value String::decode(ByteSource& source, const Context& context, ByteOrder /*inherited*/) const
    {
        return Value(utils::decodeText(m_bytes.decodeRaw(source, context), m_codec));
    }

} // namespace binform
