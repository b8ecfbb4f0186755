// ChunkPipeline.h — цикл обработки chunks одной передачи
// Связывает ChunkCodec, TransferSession и ByteSource/ByteSink

#pragma once

#include "../export.h"
#include "../Types.h"
#include "../Security/ChunkCodec.h"
#include "ByteStream.h"
#include "TransferSession.h"
#include <memory>
#include <optional>
#include <vector>

namespace FileTT {

constexpr size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;   // 1 MB chunks

/// Что делать с каждым chunk в run()
enum class ChunkOperation {
    Seal,    // plaintext → frame (сохранение upload, отправка download)
    Open     // frame → plaintext (приёмная сторона)
};

// ═══════════════════════════════════════════════════════════
// ChunkPipeline
// ═══════════════════════════════════════════════════════════
//
// Отмена проверяется перед чтением, после чтения и после записи.
// Запись, уже начатая в sink, завершается целиком.

class FTT_API ChunkPipeline {
public:
    /// Ключ берётся из сессии. Без ключа кодек работает в режиме Plaintext.
    /// @throws ProtocolError если ключа нет и allowPlaintext == false
    explicit ChunkPipeline(std::shared_ptr<TransferSession> session, bool allowPlaintext = true);
    ~ChunkPipeline();

    // Запрет копирования
    ChunkPipeline(const ChunkPipeline&) = delete;
    ChunkPipeline& operator=(const ChunkPipeline&) = delete;

    CodecMode mode() const;
    const std::shared_ptr<TransferSession>& session() const { return m_session; }

    /// Один chunk на отправку/хранение.
    /// @return frame (или байты как есть в режиме Plaintext);
    ///         nullopt если сессия terminal или отменена
    std::optional<std::vector<uint8_t>> encodeChunk(const std::vector<uint8_t>& chunk);

    /// Один принятый frame.
    /// @return plaintext; nullopt если сессия terminal или отменена
    /// @throws AuthenticationError / ProtocolError (сессия переходит в Failed)
    std::optional<std::vector<uint8_t>> decodeChunk(const std::vector<uint8_t>& frame);

    /// Прогнать весь source через кодек в sink.
    /// TransportError переводит сессию в Failed; при Canceled/Failed вызывается sink.discard(),
    /// при Completed вызывается sink.commit().
    /// @return итоговое состояние сессии
    TransferState run(
        ByteSource& source,
        ByteSink& sink,
        TransferDirection direction,
        size_t chunkSize = DEFAULT_CHUNK_SIZE,
        ChunkOperation operation = ChunkOperation::Seal
    );

private:
    std::shared_ptr<TransferSession> m_session;
    std::shared_ptr<const KeyMaterial> m_key;
    std::unique_ptr<ChunkCodec> m_codec;
};

} // namespace FileTT
