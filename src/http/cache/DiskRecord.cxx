// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DiskRecord.hxx"
#include "Error.hxx"
#include "serialize.hxx"
#include "http-cache-store/DiskRecord.hxx"

using namespace HttpCacheStore;

static void
SerializeTime(std::string &dest, HttpCacheTime t)
{
	serialize_int64(dest, t.time_since_epoch().count());
}

static HttpCacheTime
DeserializeTime(std::string_view &input)
{
	return HttpCacheTime{std::chrono::seconds{deserialize_int64(input)}};
}

static void
SerializeParsedValue(std::string &dest, const HttpCacheParsedValue &value)
{
	if (const auto *s = std::get_if<std::string>(&value)) {
		serialize_uint8(dest, uint8_t(DiskRecordValueType::STRING));
		serialize_string(dest, *s);
	} else if (const auto *i = std::get_if<int64_t>(&value)) {
		serialize_uint8(dest, uint8_t(DiskRecordValueType::INTEGER));
		serialize_int64(dest, *i);
	} else {
		const auto &range = std::get<HttpContentRange>(value);
		serialize_uint8(dest, uint8_t(DiskRecordValueType::CONTENT_RANGE));
		serialize_uint64(dest, range.first);
		serialize_uint64(dest, range.last);
		serialize_uint8(dest, range.complete_length.has_value());
		if (range.complete_length)
			serialize_uint64(dest, *range.complete_length);
	}
}

static HttpCacheParsedValue
DeserializeParsedValue(std::string_view &input)
{
	switch (DiskRecordValueType(deserialize_uint8(input))) {
	case DiskRecordValueType::STRING:
		return std::string{deserialize_string(input)};

	case DiskRecordValueType::INTEGER:
		return deserialize_int64(input);

	case DiskRecordValueType::CONTENT_RANGE:
		{
			HttpContentRange range;
			range.first = deserialize_uint64(input);
			range.last = deserialize_uint64(input);
			if (deserialize_uint8(input) != 0)
				range.complete_length = deserialize_uint64(input);
			if (range.last < range.first)
				throw DeserializeError();
			return range;
		}
	}

	throw DeserializeError();
}

static void
SerializeTtlSource(std::string &dest, HttpCacheTtlSource source)
{
	serialize_uint8(dest, uint8_t(source == HttpCacheTtlSource::HEADER
				      ? DiskRecordTtlSource::HEADER
				      : DiskRecordTtlSource::HEURISTIC));
}

static HttpCacheTtlSource
DeserializeTtlSource(std::string_view &input)
{
	switch (DiskRecordTtlSource(deserialize_uint8(input))) {
	case DiskRecordTtlSource::HEADER:
		return HttpCacheTtlSource::HEADER;

	case DiskRecordTtlSource::HEURISTIC:
		return HttpCacheTtlSource::HEURISTIC;
	}

	throw DeserializeError();
}

std::string
SerializeDiskRecord(const HttpCacheDiskRecord &record)
{
	std::string dest;

	serialize_uint32(dest, DISK_RECORD_MAGIC);
	serialize_uint16(dest, DISK_RECORD_VERSION);

	serialize_string(dest, record.key);
	serialize_string(dest, record.url_digest);
	serialize_uint16(dest, uint16_t(record.status));

	serialize_uint32(dest, record.headers.size());
	for (const auto &[name, value] : record.headers) {
		serialize_string(dest, name);
		serialize_string(dest, value);
	}

	serialize_uint32(dest, record.vary.size());
	for (const auto &[name, value] : record.vary) {
		serialize_string(dest, name);
		serialize_uint8(dest, value.has_value());
		if (value)
			serialize_string(dest, *value);
	}

	const auto &metadata = record.metadata;
	SerializeTime(dest, metadata.created);
	SerializeTime(dest, metadata.expires);
	SerializeTime(dest, metadata.grace);
	SerializeTtlSource(dest, metadata.ttl_set_by);

	serialize_uint32(dest, metadata.parsed_headers.size());
	for (const auto &[name, value] : metadata.parsed_headers) {
		serialize_string(dest, name);
		SerializeParsedValue(dest, value);
	}

	serialize_uint32(dest, metadata.alternate_keys.size());
	for (const auto &i : metadata.alternate_keys)
		serialize_string(dest, i);

	serialize_uint64(dest, record.body_size);

	return dest;
}

HttpCacheDiskRecord
DeserializeDiskRecord(std::string_view input)
{
	if (deserialize_uint32(input) != DISK_RECORD_MAGIC ||
	    deserialize_uint16(input) != DISK_RECORD_VERSION)
		throw DeserializeError();

	HttpCacheDiskRecord record;
	record.key = deserialize_string(input);
	record.url_digest = deserialize_string(input);
	record.status = HttpStatus(deserialize_uint16(input));
	if (!http_status_is_valid(record.status))
		throw DeserializeError();

	for (uint32_t n = deserialize_uint32(input); n > 0; --n) {
		std::string name{deserialize_string(input)};
		std::string value{deserialize_string(input)};
		record.headers.emplace_back(std::move(name), std::move(value));
	}

	for (uint32_t n = deserialize_uint32(input); n > 0; --n) {
		std::string name{deserialize_string(input)};
		std::optional<std::string> value;
		if (deserialize_uint8(input) != 0)
			value.emplace(deserialize_string(input));
		record.vary.insert_or_assign(std::move(name), std::move(value));
	}

	auto &metadata = record.metadata;
	metadata.created = DeserializeTime(input);
	metadata.expires = DeserializeTime(input);
	metadata.grace = DeserializeTime(input);
	metadata.ttl_set_by = DeserializeTtlSource(input);

	for (uint32_t n = deserialize_uint32(input); n > 0; --n) {
		std::string name{deserialize_string(input)};
		auto value = DeserializeParsedValue(input);
		metadata.parsed_headers.insert_or_assign(std::move(name),
							 std::move(value));
	}

	for (uint32_t n = deserialize_uint32(input); n > 0; --n)
		metadata.alternate_keys.emplace(deserialize_string(input));

	record.body_size = deserialize_uint64(input);

	if (!input.empty())
		/* trailing garbage */
		throw DeserializeError();

	try {
		metadata.Validate();
	} catch (const HttpCacheInvalidMetadata &) {
		throw DeserializeError();
	}

	return record;
}
