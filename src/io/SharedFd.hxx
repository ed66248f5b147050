// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/UniqueFileDescriptor.hxx"

#include <memory>

/**
 * A read-only file descriptor which can be used by multiple
 * entities.  It is owned by std::shared_ptr and closed as soon as the
 * last reference is released.  The file remains readable after it
 * has been unlinked.
 */
class SharedFd final {
	const UniqueFileDescriptor fd;

public:
	explicit SharedFd(UniqueFileDescriptor &&_fd) noexcept
		:fd(std::move(_fd)) {}

	SharedFd(const SharedFd &) = delete;
	SharedFd &operator=(const SharedFd &) = delete;

	const UniqueFileDescriptor &Get() const noexcept {
		return fd;
	}
};
