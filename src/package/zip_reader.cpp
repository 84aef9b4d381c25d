#include "package/zip_reader.hpp"
#include "error/store_error.hpp"
#include "store/flat_file.hpp"
#include <boost/crc.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/log/trivial.hpp>

namespace tutor {
namespace package {

namespace {

constexpr uint32_t END_OF_CENTRAL_DIRECTORY_SIGNATURE = 0x06054b50;
constexpr uint32_t CENTRAL_DIRECTORY_SIGNATURE = 0x02014b50;
constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;

constexpr std::size_t END_OF_CENTRAL_DIRECTORY_SIZE = 22;
constexpr std::size_t CENTRAL_DIRECTORY_HEADER_SIZE = 46;
constexpr std::size_t LOCAL_HEADER_SIZE = 30;
constexpr std::size_t MAX_COMMENT_SIZE = 0xFFFF;

constexpr uint16_t METHOD_STORED = 0;
constexpr uint16_t METHOD_DEFLATED = 8;
constexpr uint16_t FLAG_ENCRYPTED = 0x0001;
constexpr uint32_t ZIP64_MARKER = 0xFFFFFFFF;

constexpr std::size_t INFLATE_CHUNK_SIZE = 4096;

} // namespace

//==============================================
// CONSTRUCTORS
//==============================================

ZipReader::ZipReader(const std::filesystem::path& archive_path) : source_(archive_path.string()) {
  BOOST_LOG_TRIVIAL(info) << "ZipReader: Opening archive " << source_;

  auto bytes = store::read_file(archive_path);
  if (!bytes) {
    BOOST_LOG_TRIVIAL(error) << "ZipReader: Archive not found: " << source_;
    throw PackageError("archive not found", source_);
  }
  data_ = std::move(*bytes);
  parse_central_directory();
}

ZipReader::ZipReader(std::string archive_bytes, std::string source_name)
  : data_(std::move(archive_bytes))
  , source_(std::move(source_name)) {
  parse_central_directory();
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<std::string> ZipReader::entry_names() const {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto& item : entries_) {
    names.push_back(item.name);
  }
  return names;
}

bool ZipReader::has_entry(const std::string& name) const {
  for (const auto& item : entries_) {
    if (item.name == name) {
      return true;
    }
  }
  return false;
}

std::string ZipReader::read_entry(const std::string& name) const {
  const Entry& item = entry(name);
  const std::string context = source_ + ":" + name;

  if (item.flags & FLAG_ENCRYPTED) {
    throw PackageError("encrypted entries are not supported", context);
  }

  // The local header repeats the name and may carry a different extra field
  require(item.local_header_offset, LOCAL_HEADER_SIZE, "local header");
  if (read_u32(item.local_header_offset) != LOCAL_HEADER_SIGNATURE) {
    throw PackageError("bad local header signature", context);
  }
  const std::size_t data_offset = item.local_header_offset + LOCAL_HEADER_SIZE +
                                  read_u16(item.local_header_offset + 26) +
                                  read_u16(item.local_header_offset + 28);
  require(data_offset, item.compressed_size, "entry data");
  const char* raw = data_.data() + data_offset;

  std::string content;
  if (item.method == METHOD_STORED) {
    content.assign(raw, item.compressed_size);
  } else if (item.method == METHOD_DEFLATED) {
    content = inflate(raw, item.compressed_size, item.uncompressed_size, context);
  } else {
    BOOST_LOG_TRIVIAL(error) << "ZipReader: Unsupported compression method " << item.method << " for " << context;
    throw PackageError("unsupported compression method " + std::to_string(item.method), context);
  }

  if (content.size() != item.uncompressed_size) {
    throw PackageError("entry size does not match the central directory", context);
  }

  boost::crc_32_type crc;
  crc.process_bytes(content.data(), content.size());
  if (crc.checksum() != item.crc32) {
    BOOST_LOG_TRIVIAL(error) << "ZipReader: CRC mismatch for " << context;
    throw PackageError("CRC mismatch", context);
  }

  BOOST_LOG_TRIVIAL(debug) << "ZipReader: Read " << content.size() << " bytes from " << context;
  return content;
}


//==============================================
// ARCHIVE PARSING
//==============================================

void ZipReader::parse_central_directory() {
  const std::size_t eocd = find_end_of_central_directory();
  const uint16_t entry_count = read_u16(eocd + 10);
  const uint32_t directory_offset = read_u32(eocd + 16);

  if (directory_offset == ZIP64_MARKER) {
    throw PackageError("ZIP64 archives are not supported", source_);
  }

  std::size_t offset = directory_offset;
  for (uint16_t i = 0; i < entry_count; ++i) {
    require(offset, CENTRAL_DIRECTORY_HEADER_SIZE, "central directory header");
    if (read_u32(offset) != CENTRAL_DIRECTORY_SIGNATURE) {
      throw PackageError("bad central directory signature", source_);
    }

    Entry item;
    item.flags = read_u16(offset + 8);
    item.method = read_u16(offset + 10);
    item.crc32 = read_u32(offset + 16);
    item.compressed_size = read_u32(offset + 20);
    item.uncompressed_size = read_u32(offset + 24);
    const uint16_t name_length = read_u16(offset + 28);
    const uint16_t extra_length = read_u16(offset + 30);
    const uint16_t comment_length = read_u16(offset + 32);
    item.local_header_offset = read_u32(offset + 42);

    require(offset + CENTRAL_DIRECTORY_HEADER_SIZE, name_length, "entry name");
    item.name = data_.substr(offset + CENTRAL_DIRECTORY_HEADER_SIZE, name_length);

    if (item.compressed_size == ZIP64_MARKER || item.uncompressed_size == ZIP64_MARKER ||
        item.local_header_offset == ZIP64_MARKER) {
      throw PackageError("ZIP64 entries are not supported", source_ + ":" + item.name);
    }

    entries_.push_back(std::move(item));
    offset += CENTRAL_DIRECTORY_HEADER_SIZE + name_length + extra_length + comment_length;
  }

  BOOST_LOG_TRIVIAL(debug) << "ZipReader: " << source_ << " has " << entries_.size() << " entries";
}

std::size_t ZipReader::find_end_of_central_directory() const {
  if (data_.size() < END_OF_CENTRAL_DIRECTORY_SIZE) {
    throw PackageError("file is too small to be a ZIP archive", source_);
  }

  // The record sits at the very end, followed only by an optional comment
  const std::size_t last = data_.size() - END_OF_CENTRAL_DIRECTORY_SIZE;
  const std::size_t first = last > MAX_COMMENT_SIZE ? last - MAX_COMMENT_SIZE : 0;
  for (std::size_t offset = last + 1; offset-- > first;) {
    if (read_u32(offset) == END_OF_CENTRAL_DIRECTORY_SIGNATURE) {
      return offset;
    }
  }

  BOOST_LOG_TRIVIAL(error) << "ZipReader: No end of central directory record in " << source_;
  throw PackageError("not a ZIP archive", source_);
}

const ZipReader::Entry& ZipReader::entry(const std::string& name) const {
  for (const auto& item : entries_) {
    if (item.name == name) {
      return item;
    }
  }
  BOOST_LOG_TRIVIAL(error) << "ZipReader: No entry " << name << " in " << source_;
  throw PackageError("archive has no entry named " + name, source_);
}

uint16_t ZipReader::read_u16(std::size_t offset) const {
  require(offset, 2, "field");
  const auto* p = reinterpret_cast<const unsigned char*>(data_.data() + offset);
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t ZipReader::read_u32(std::size_t offset) const {
  require(offset, 4, "field");
  const auto* p = reinterpret_cast<const unsigned char*>(data_.data() + offset);
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

void ZipReader::require(std::size_t offset, std::size_t length, const char* what) const {
  if (offset > data_.size() || length > data_.size() - offset) {
    throw PackageError(std::string("truncated archive (") + what + ")", source_);
  }
}

std::string ZipReader::inflate(const char* data, std::size_t size, std::size_t declared_size,
                               const std::string& context) {
  // ZIP stores raw deflate streams without the zlib header
  boost::iostreams::zlib_params params;
  params.noheader = true;

  std::string output;
  try {
    boost::iostreams::filtering_istream input;
    input.exceptions(std::ios_base::badbit);
    input.push(boost::iostreams::zlib_decompressor(params));
    input.push(boost::iostreams::array_source(data, size));

    char buffer[INFLATE_CHUNK_SIZE];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
      const auto count = static_cast<std::size_t>(input.gcount());
      // Stop as soon as the stream outgrows the central directory's claim
      if (count > declared_size - output.size()) {
        BOOST_LOG_TRIVIAL(error) << "ZipReader: " << context << " inflates beyond its declared "
                                 << declared_size << " bytes";
        throw PackageError("entry inflates beyond its declared size", context);
      }
      output.append(buffer, count);
    }
  }
  // zlib_error derives from ios_base::failure
  catch (const std::ios_base::failure& e) {
    BOOST_LOG_TRIVIAL(error) << "ZipReader: Failed to inflate " << context << ": " << e.what();
    throw PackageError("corrupt deflate data", context);
  }
  return output;
}

} // namespace package
} // namespace tutor
