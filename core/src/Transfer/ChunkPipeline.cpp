// ChunkPipeline.cpp — последовательная обработка chunks с проверками отмены

#include "filett/Transfer/ChunkPipeline.h"
#include "filett/Errors.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace FileTT {

ChunkPipeline::ChunkPipeline(std::shared_ptr<TransferSession> session, bool allowPlaintext)
    : m_session(std::move(session)) {
    if (!m_session) {
        throw std::invalid_argument("ChunkPipeline requires a session");
    }

    m_key = m_session->keyMaterial();
    if (m_key) {
        m_codec = std::make_unique<ChunkCodec>(m_key->transportKey);
    } else if (allowPlaintext) {
        spdlog::warn("ChunkPipeline: transfer {} has no key, using plaintext fallback",
                     m_session->transferId());
        m_codec = std::make_unique<ChunkCodec>();
    } else {
        throw ProtocolError("No key established for transfer " + m_session->transferId());
    }
}

ChunkPipeline::~ChunkPipeline() = default;

CodecMode ChunkPipeline::mode() const {
    return m_codec->mode();
}

// ═══════════════════════════════════════════════════════════
// Отдельные chunks
// ═══════════════════════════════════════════════════════════

std::optional<std::vector<uint8_t>> ChunkPipeline::encodeChunk(const std::vector<uint8_t>& chunk) {
    if (m_session->observeCancellation() || m_session->isTerminal()) {
        return std::nullopt;
    }

    std::vector<uint8_t> frame;
    try {
        frame = m_codec->seal(chunk);
    } catch (const std::exception& e) {
        m_session->markFailed(std::string("Encryption failed: ") + e.what());
        throw;
    }

    if (!m_session->recordChunk(chunk.size())) {
        return std::nullopt;
    }
    return frame;
}

std::optional<std::vector<uint8_t>> ChunkPipeline::decodeChunk(const std::vector<uint8_t>& frame) {
    if (m_session->observeCancellation() || m_session->isTerminal()) {
        return std::nullopt;
    }

    std::vector<uint8_t> plaintext;
    try {
        plaintext = m_codec->open(frame);
    } catch (const AuthenticationError& e) {
        m_session->markFailed(e.what());
        throw;
    } catch (const ProtocolError& e) {
        m_session->markFailed(e.what());
        throw;
    }

    if (!m_session->recordChunk(plaintext.size())) {
        return std::nullopt;
    }
    return plaintext;
}

// ═══════════════════════════════════════════════════════════
// Полный цикл
// ═══════════════════════════════════════════════════════════

TransferState ChunkPipeline::run(
    ByteSource& source,
    ByteSink& sink,
    TransferDirection direction,
    size_t chunkSize,
    ChunkOperation operation
) {
    if (chunkSize == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }

    const bool encrypted = m_codec->isEncrypted();
    const uint64_t total = source.totalSize();
    size_t readSize = chunkSize;
    uint64_t expected = total;

    if (operation == ChunkOperation::Open && encrypted) {
        // Каждый frame = chunk + nonce + tag
        readSize = chunkSize + CHUNK_FRAME_OVERHEAD;
        uint64_t frames = (total + readSize - 1) / readSize;
        expected = total > frames * CHUNK_FRAME_OVERHEAD ? total - frames * CHUNK_FRAME_OVERHEAD : 0;
    } else if (operation == ChunkOperation::Seal && encrypted && m_codec->chunksSealed() == 0) {
        uint64_t chunks = (total + chunkSize - 1) / chunkSize;
        if (chunks > RANDOM_NONCE_LIMIT) {
            m_codec = std::make_unique<ChunkCodec>(m_key->transportKey, chunks);
        }
    }

    if (!m_session->begin(direction, expected)) {
        spdlog::warn("ChunkPipeline: transfer {} is already {}", m_session->transferId(),
                     transferStateToString(m_session->state()));
        sink.discard();
        return m_session->state();
    }

    spdlog::info("ChunkPipeline: {} {} ({} bytes, {} mode)", transferDirectionToString(direction),
                 m_session->transferId(), total, codecModeToString(m_codec->mode()));

    uint64_t chunkIndex = 0;
    try {
        while (true) {
            // Перед чтением
            if (m_session->observeCancellation() || m_session->isTerminal()) {
                break;
            }

            auto bytes = source.read(readSize);
            if (bytes.empty()) {
                m_session->markCompleted();
                break;
            }

            // После чтения: прочитанный chunk отбрасывается
            if (m_session->observeCancellation()) {
                spdlog::debug("ChunkPipeline: dropping chunk {} of {}", chunkIndex, m_session->transferId());
                break;
            }

            std::vector<uint8_t> out;
            uint64_t plainSize = bytes.size();
            if (operation == ChunkOperation::Seal) {
                out = m_codec->seal(bytes);
            } else {
                out = m_codec->open(bytes);
                plainSize = out.size();
            }

            sink.write(out);

            // После записи
            if (!m_session->recordChunk(plainSize)) {
                break;
            }
            ++chunkIndex;
        }
    } catch (const TransportError& e) {
        m_session->markFailed(e.what());
    } catch (const AuthenticationError& e) {
        m_session->markFailed(e.what());
    } catch (const ProtocolError& e) {
        m_session->markFailed(e.what());
    } catch (const std::exception& e) {
        m_session->markFailed(e.what());
        sink.discard();
        throw;
    }

    TransferState state = m_session->state();
    if (state == TransferState::Completed) {
        sink.commit();
    } else if (state == TransferState::Canceled || state == TransferState::Failed) {
        sink.discard();
    }

    spdlog::info("ChunkPipeline: {} finished as {} after {} chunks", m_session->transferId(),
                 transferStateToString(state), chunkIndex);
    return state;
}

} // namespace FileTT
