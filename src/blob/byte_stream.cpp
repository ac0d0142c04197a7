#include "blob/byte_stream.hpp"
#include <exception>
#include <ios>
#include <utility>

namespace hold {
namespace blob {

namespace {

class EmptyStream : public ByteStream {
protected:
  bool produce(Chunk& /*chunk*/) override { return false; }
};

class BufferStream : public ByteStream {
public:
  explicit BufferStream(Chunk bytes) : bytes_(std::move(bytes)) {}

protected:
  bool produce(Chunk& chunk) override {
    if (taken_) {
      return false;
    }
    taken_ = true;
    chunk = std::move(bytes_);
    return true;
  }

private:
  Chunk bytes_;
  bool taken_ = false;
};

class IstreamStream : public ByteStream {
public:
  IstreamStream(std::unique_ptr<std::istream> input, std::size_t chunk_size)
    : input_(std::move(input)), chunk_size_(chunk_size == 0 ? DEFAULT_CHUNK_SIZE : chunk_size) {}

protected:
  bool produce(Chunk& chunk) override {
    if (!input_ || input_->eof()) {
      return false;
    }
    if (input_->bad()) {
      throw std::ios_base::failure("Byte stream: input stream is in a bad state");
    }

    chunk.resize(chunk_size_);
    input_->read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk_size_));
    std::streamsize bytes = input_->gcount();
    chunk.resize(static_cast<std::size_t>(bytes));

    // failbit without eofbit means the read itself failed, not that data ran out
    if (input_->bad() || (input_->fail() && !input_->eof())) {
      throw std::ios_base::failure("Byte stream: failed to read from input stream");
    }
    return bytes > 0;
  }

private:
  std::unique_ptr<std::istream> input_;
  std::size_t chunk_size_;
};

class ProducerStream : public ByteStream {
public:
  explicit ProducerStream(ProducerFn producer) : producer_(std::move(producer)) {}

protected:
  bool produce(Chunk& chunk) override {
    return producer_ && producer_(chunk);
  }

private:
  ProducerFn producer_;
};

class SizedStream : public ByteStream {
public:
  SizedStream(ByteStreamPtr source, std::uint64_t size)
    : source_(std::move(source)), size_(size) {}

protected:
  bool produce(Chunk& chunk) override {
    if (!source_ || !source_->next(chunk)) {
      if (produced_ != size_) {
        throw std::ios_base::failure("Byte stream: declared " + std::to_string(size_) +
                                     " bytes but source ended after " + std::to_string(produced_));
      }
      return false;
    }

    produced_ += chunk.size();
    if (produced_ > size_) {
      throw std::ios_base::failure("Byte stream: source produced more than the declared " +
                                   std::to_string(size_) + " bytes");
    }
    return true;
  }

private:
  ByteStreamPtr source_;
  std::uint64_t size_;
  std::uint64_t produced_ = 0;
};

} // namespace


//==============================================
// STREAM CONSTRUCTION METHODS
//==============================================

ByteStreamPtr ByteStream::empty() {
  return std::make_unique<EmptyStream>();
}

ByteStreamPtr ByteStream::from_bytes(Chunk bytes) {
  return std::make_unique<BufferStream>(std::move(bytes));
}

ByteStreamPtr ByteStream::from_string(const std::string& data) {
  return from_bytes(Chunk(data.begin(), data.end()));
}

ByteStreamPtr ByteStream::from_istream(std::unique_ptr<std::istream> input, std::size_t chunk_size) {
  return std::make_unique<IstreamStream>(std::move(input), chunk_size);
}

ByteStreamPtr ByteStream::create(ProducerFn producer) {
  return std::make_unique<ProducerStream>(std::move(producer));
}

ByteStreamPtr ByteStream::sized(ByteStreamPtr source, std::uint64_t size) {
  return std::make_unique<SizedStream>(std::move(source), size);
}


//==============================================
// STREAM CONSUMPTION
//==============================================

bool ByteStream::next(Chunk& chunk) {
  // Producers may hand out empty chunks before the end, skip over them
  while (!exhausted_) {
    chunk.clear();

    bool more = false;
    try {
      more = produce(chunk);
    } catch (const std::ios_base::failure&) {
      exhausted_ = true;
      throw;
    } catch (const std::exception& e) {
      exhausted_ = true;
      std::throw_with_nested(std::ios_base::failure(std::string("Byte stream: read failed: ") + e.what()));
    }

    if (!more) {
      exhausted_ = true;
      break;
    }
    if (!chunk.empty()) {
      bytes_read_ += chunk.size();
      return true;
    }
  }

  chunk.clear();
  return false;
}

Chunk read_all(ByteStream& stream) {
  Chunk result;
  Chunk chunk;
  while (stream.next(chunk)) {
    result.insert(result.end(), chunk.begin(), chunk.end());
  }
  return result;
}

std::uint64_t copy_to(ByteStream& stream, std::ostream& output) {
  std::uint64_t total_bytes = 0;
  Chunk chunk;
  while (stream.next(chunk)) {
    output.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    if (!output) {
      throw std::ios_base::failure("Byte stream: failed to write to output stream");
    }
    total_bytes += chunk.size();
  }
  return total_bytes;
}

} // namespace blob
} // namespace hold
