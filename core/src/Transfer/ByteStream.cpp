#include "filett/Transfer/ByteStream.h"
#include "filett/Errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace FileTT {

// ═══════════════════════════════════════════════════════════
// MemorySource / MemorySink
// ═══════════════════════════════════════════════════════════

std::vector<uint8_t> MemorySource::read(size_t maxBytes) {
    size_t count = std::min(maxBytes, m_data.size() - m_position);
    std::vector<uint8_t> chunk(m_data.begin() + m_position, m_data.begin() + m_position + count);
    m_position += count;
    return chunk;
}

void MemorySink::write(const std::vector<uint8_t>& bytes) {
    m_chunks.push_back(bytes);
}

void MemorySink::discard() {
    m_chunks.clear();
    m_discarded = true;
}

std::vector<uint8_t> MemorySink::contents() const {
    std::vector<uint8_t> result;
    for (const auto& chunk : m_chunks) {
        result.insert(result.end(), chunk.begin(), chunk.end());
    }
    return result;
}

// ═══════════════════════════════════════════════════════════
// FileSource
// ═══════════════════════════════════════════════════════════

FileSource::FileSource(const std::string& path)
    : m_path(path)
    , m_file(path, std::ios::binary | std::ios::ate) {
    if (!m_file.is_open()) {
        throw ResourceNotFound("File not found: " + path);
    }
    m_size = static_cast<uint64_t>(m_file.tellg());
    m_file.seekg(0);
}

std::vector<uint8_t> FileSource::read(size_t maxBytes) {
    std::vector<uint8_t> buffer(maxBytes);
    m_file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(maxBytes));
    size_t actualRead = static_cast<size_t>(m_file.gcount());

    if (m_file.bad()) {
        throw TransportError("Failed to read " + m_path);
    }

    buffer.resize(actualRead);
    return buffer;
}

// ═══════════════════════════════════════════════════════════
// FileSink
// ═══════════════════════════════════════════════════════════

FileSink::FileSink(const std::string& path)
    : m_path(path) {
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
    }

    m_file.open(path, std::ios::binary | std::ios::trunc);
    if (!m_file.is_open()) {
        throw TransportError("Failed to create " + path);
    }
}

FileSink::~FileSink() {
    if (!m_committed) {
        discard();
    }
}

void FileSink::write(const std::vector<uint8_t>& bytes) {
    if (!m_file.is_open()) {
        throw TransportError("Sink already closed: " + m_path);
    }
    m_file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!m_file) {
        throw TransportError("Failed to write " + m_path);
    }
}

void FileSink::commit() {
    if (m_file.is_open()) {
        m_file.close();
    }
    m_committed = true;
}

void FileSink::discard() {
    if (m_file.is_open()) {
        m_file.close();
    }
    std::error_code ec;
    if (fs::remove(m_path, ec)) {
        spdlog::info("FileSink: removed partial file {}", m_path);
    } else if (ec) {
        spdlog::warn("FileSink: failed to remove {}: {}", m_path, ec.message());
    }
}

} // namespace FileTT
