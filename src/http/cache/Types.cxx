// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Types.hxx"
#include "system/Error.hxx"

#include <fmt/format.h>

#include <stdexcept>

uint64_t
HttpCacheStoredResponse::GetBodySize() const noexcept
{
	if (const auto *s = std::get_if<std::string>(&body))
		return s->size();

	return std::get<HttpCacheFileBody>(body).size;
}

std::string
HttpCacheReadBody(const HttpCacheBody &body)
{
	if (const auto *s = std::get_if<std::string>(&body))
		return *s;

	const auto &file = std::get<HttpCacheFileBody>(body);

	UniqueFileDescriptor own;
	const UniqueFileDescriptor *fd;
	if (file.fd) {
		fd = &file.fd->Get();
	} else {
		if (!own.OpenReadOnly(file.path.c_str()))
			throw FmtErrno("Failed to open {}", file.path.string());
		fd = &own;
	}

	std::string result(file.size, '\0');

	std::size_t position = 0;
	while (position < result.size()) {
		const auto nbytes = fd->ReadAt(position, result.data() + position,
					       result.size() - position);
		if (nbytes < 0)
			throw FmtErrno("Failed to read {}", file.path.string());

		if (nbytes == 0)
			throw std::runtime_error{fmt::format("Premature end of file {}",
							     file.path.string())};

		position += nbytes;
	}

	return result;
}
