// ByteStream.h — непрозрачные источник и приёмник байт для ChunkPipeline
// Файловые и in-memory реализации

#pragma once

#include "../export.h"
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace FileTT {

// ═══════════════════════════════════════════════════════════
// Интерфейсы
// ═══════════════════════════════════════════════════════════

class FTT_API ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Прочитать до maxBytes. Пустой результат = конец потока.
    /// @throws TransportError при ошибке I/O
    virtual std::vector<uint8_t> read(size_t maxBytes) = 0;

    /// Полный размер, 0 если неизвестен
    virtual uint64_t totalSize() const = 0;
};

class FTT_API ByteSink {
public:
    virtual ~ByteSink() = default;

    /// Записать один chunk (frame или plaintext) целиком
    /// @throws TransportError при ошибке I/O
    virtual void write(const std::vector<uint8_t>& bytes) = 0;

    /// Передача завершена успешно
    virtual void commit() {}

    /// Передача отменена или провалилась: частичные данные удаляются
    virtual void discard() = 0;
};

// ═══════════════════════════════════════════════════════════
// In-memory
// ═══════════════════════════════════════════════════════════

class FTT_API MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<uint8_t> data) : m_data(std::move(data)) {}

    std::vector<uint8_t> read(size_t maxBytes) override;
    uint64_t totalSize() const override { return m_data.size(); }

    size_t position() const { return m_position; }

private:
    std::vector<uint8_t> m_data;
    size_t m_position = 0;
};

class FTT_API MemorySink : public ByteSink {
public:
    void write(const std::vector<uint8_t>& bytes) override;
    void commit() override { m_committed = true; }
    void discard() override;

    /// Все записи по порядку (одна запись = один chunk)
    const std::vector<std::vector<uint8_t>>& chunks() const { return m_chunks; }

    /// Склеенное содержимое
    std::vector<uint8_t> contents() const;

    bool committed() const { return m_committed; }
    bool discarded() const { return m_discarded; }

private:
    std::vector<std::vector<uint8_t>> m_chunks;
    bool m_committed = false;
    bool m_discarded = false;
};

// ═══════════════════════════════════════════════════════════
// Файлы
// ═══════════════════════════════════════════════════════════

class FTT_API FileSource : public ByteSource {
public:
    /// @throws ResourceNotFound если файл не открылся
    explicit FileSource(const std::string& path);

    std::vector<uint8_t> read(size_t maxBytes) override;
    uint64_t totalSize() const override { return m_size; }

private:
    std::string m_path;
    std::ifstream m_file;
    uint64_t m_size = 0;
};

/// Частичный файл удаляется при discard() и при разрушении без commit()
class FTT_API FileSink : public ByteSink {
public:
    /// @throws TransportError если файл не создаётся
    explicit FileSink(const std::string& path);
    ~FileSink() override;

    // Запрет копирования
    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(const std::vector<uint8_t>& bytes) override;
    void commit() override;
    void discard() override;

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    std::ofstream m_file;
    bool m_committed = false;
};

} // namespace FileTT
