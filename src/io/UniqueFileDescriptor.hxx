// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <utility>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

/**
 * Owns a file descriptor and closes it in the destructor.
 */
class UniqueFileDescriptor {
	int fd = -1;

public:
	UniqueFileDescriptor() noexcept = default;

	explicit UniqueFileDescriptor(int _fd) noexcept
		:fd(_fd) {}

	UniqueFileDescriptor(UniqueFileDescriptor &&src) noexcept
		:fd(std::exchange(src.fd, -1)) {}

	~UniqueFileDescriptor() noexcept {
		if (IsDefined())
			close(fd);
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	bool IsDefined() const noexcept {
		return fd >= 0;
	}

	int Get() const noexcept {
		return fd;
	}

	/**
	 * @return false on error (with errno set)
	 */
	bool OpenReadOnly(const char *path) noexcept {
		UniqueFileDescriptor tmp{open(path, O_RDONLY|O_CLOEXEC|O_NOCTTY)};
		if (!tmp.IsDefined())
			return false;

		*this = std::move(tmp);
		return true;
	}

	/**
	 * Read at the given offset without moving the file position,
	 * so the descriptor may be shared by several readers.
	 */
	ssize_t ReadAt(off_t offset, void *buffer, std::size_t size) const noexcept {
		return pread(fd, buffer, size, offset);
	}
};
