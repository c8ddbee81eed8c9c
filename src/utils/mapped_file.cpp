#include "utils/mapped_file.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::utils {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
MappedFile::MappedFile(MappedFile&& other) noexcept : _fd(exchange(other._fd, -1)), _data(exchange(other._data, nullptr)), _length(exchange(other._length, 0))
// Move constructor
{
}
//---------------------------------------------------------------------------
MappedFile& MappedFile::operator=(MappedFile&& other) noexcept
// Move assignment
{
    if (this != &other) {
        unmap();
        close();
        _fd = exchange(other._fd, -1);
        _data = exchange(other._data, nullptr);
        _length = exchange(other._length, 0);
    }
    return *this;
}
//---------------------------------------------------------------------------
MappedFile::~MappedFile()
// The destructor
{
    unmap();
    close();
}
//---------------------------------------------------------------------------
MappedFile MappedFile::open(const string& path, uint64_t length)
// Opens and maps the file
{
    MappedFile file;
    file._fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (file._fd < 0)
        throw runtime_error("cannot open " + path + ": " + strerror(errno));

    struct stat st;
    if (::fstat(file._fd, &st) != 0)
        throw runtime_error("cannot stat " + path + ": " + strerror(errno));
    if (static_cast<uint64_t>(st.st_size) < length)
        throw runtime_error("source " + path + " is smaller than the expected " + to_string(length) + " bytes");

    if (!length)
        return file;

    auto* data = ::mmap(nullptr, length, PROT_READ, MAP_SHARED, file._fd, 0);
    if (data == MAP_FAILED)
        throw runtime_error("cannot map " + path + ": " + strerror(errno));
    // Chunks are read front to back by many workers
    ::madvise(data, length, MADV_SEQUENTIAL);

    file._data = static_cast<const uint8_t*>(data);
    file._length = length;
    return file;
}
//---------------------------------------------------------------------------
span<const uint8_t> MappedFile::slice(uint64_t offset, uint64_t length) const
// A slice of the view
{
    if (offset > _length || length > _length - offset)
        throw out_of_range("slice [" + to_string(offset) + ", " + to_string(offset + length) + ") exceeds mapping of " + to_string(_length) + " bytes");
    return {_data + offset, length};
}
//---------------------------------------------------------------------------
void MappedFile::unmap()
// Unmaps the region
{
    if (!_data)
        return;
    ::munmap(const_cast<uint8_t*>(_data), _length);
    _data = nullptr;
    _length = 0;
}
//---------------------------------------------------------------------------
int MappedFile::close()
// Closes the descriptor
{
    if (_fd < 0)
        return 0;
    auto fd = exchange(_fd, -1);
    if (::close(fd) != 0)
        return errno;
    return 0;
}
//---------------------------------------------------------------------------
} // namespace blobcopy::utils
