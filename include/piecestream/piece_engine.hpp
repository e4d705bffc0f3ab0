/*

Copyright (c) 2026, the piecestream authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef PIECESTREAM_PIECE_ENGINE_HPP_INCLUDED
#define PIECESTREAM_PIECE_ENGINE_HPP_INCLUDED

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>

#include "piecestream/config.hpp"
#include "piecestream/units.hpp"
#include "piecestream/byte_range.hpp"
#include "piecestream/piece_range.hpp"
#include "piecestream/download_priority.hpp"
#include "piecestream/error_code.hpp"

namespace piecestream {

	// the download state of one piece, as reported by a piece engine
	struct PIECESTREAM_EXPORT piece_record
	{
		piece_index_t index{0};

		// the size of the piece, in bytes
		int length = 0;

		// the number of bytes of this piece we still don't have
		int missing = 0;

		// this is the only test the streaming core makes of a piece's state
		bool downloaded() const { return missing == 0 && length > 0; }
	};

	using chunk_buffer = std::vector<char>;

	// chunks are immutable once stored. A reader holding one keeps it alive
	// even if it is evicted from the store in the meantime.
	using chunk_ptr = std::shared_ptr<chunk_buffer const>;

	// the storage a piece engine keeps downloaded pieces in. Engines put
	// pieces as they complete and get them as they serve reads. A get may
	// fail with errors::piece_evicted, in which case the engine must fetch
	// the piece again.
	struct PIECESTREAM_EXPORT chunk_store
	{
		virtual void put(piece_index_t piece, chunk_buffer data, error_code& ec) = 0;
		virtual chunk_ptr get(piece_index_t piece, error_code& ec) = 0;
		virtual bool contains(piece_index_t piece) const = 0;

		// releases every chunk. Calling it more than once has no effect
		virtual void close() = 0;

		virtual ~chunk_store();
	};

	using chunk_store_constructor = std::function<std::unique_ptr<chunk_store>()>;

	// an ordered stream of the bytes of one byte_range
	struct PIECESTREAM_EXPORT byte_reader
	{
		using read_handler = std::function<void(error_code const&, std::size_t)>;

		// reads up to ``boost::asio::buffer_size(buf)`` bytes. The handler is
		// called with at least one byte, or with an error. After the last
		// byte of the range, reads fail with boost::asio::error::eof.
		virtual void async_read(boost::asio::mutable_buffer buf, read_handler handler) = 0;

		// stops the reader. An outstanding read completes with
		// boost::asio::error::operation_aborted
		virtual void close() = 0;

		virtual ~byte_reader();
	};

	using subscription_id = std::uint64_t;

	// everything a piece engine receives when it's constructed for a
	// transfer
	struct PIECESTREAM_EXPORT piece_engine_params
	{
		piece_engine_params(boost::asio::io_context& ioc, chunk_store_constructor s)
			: io_context(ioc), storage(std::move(s)) {}

		boost::asio::io_context& io_context;

		// creates the chunk_store the engine must keep its pieces in
		chunk_store_constructor storage;
	};

	// the lower-level engine that fetches pieces of one transfer. The
	// streaming core only tells it which pieces are urgent, observes its
	// progress and reads bytes from it.
	//
	// All functions except the notification callbacks are called on the
	// session's io_context. Progress callbacks may be invoked from any
	// thread.
	struct PIECESTREAM_EXPORT piece_engine
	{
		virtual std::string name() const = 0;

		// zero until the engine knows the layout of the content
		virtual int piece_length() const = 0;
		virtual std::int64_t content_length() const = 0;
		virtual int num_pieces() const = 0;

		// nullopt if the piece has not been started
		virtual std::optional<piece_record> piece_status(piece_index_t piece) const = 0;

		virtual void select(piece_index_t first, piece_index_t last
			, piece_priority_t prio) = 0;
		virtual void deselect(piece_index_t first, piece_index_t last
			, piece_priority_t prio) = 0;

		// fails with metadata_not_ready until the content length is known
		virtual std::unique_ptr<byte_reader> create_reader(byte_range const& r
			, error_code& ec) = 0;

		// the callback is invoked whenever download progress is made, when
		// the metadata becomes available and when the content completes
		virtual subscription_id subscribe(std::function<void()> cb) = 0;
		virtual void unsubscribe(subscription_id id) = 0;

		virtual ~piece_engine();
	};

	using piece_engine_constructor
		= std::function<std::shared_ptr<piece_engine>(piece_engine_params)>;

	// true if the engine reports the piece as fully downloaded
	PIECESTREAM_EXPORT bool is_downloaded(piece_engine const& e, piece_index_t piece);

	// true if every piece in the range is downloaded
	PIECESTREAM_EXPORT bool all_downloaded(piece_engine const& e, piece_index_range r);

	// the number of pieces in the range that are downloaded
	PIECESTREAM_EXPORT int num_downloaded(piece_engine const& e, piece_index_range r);

	// the downloaded state of every piece of the content
	PIECESTREAM_EXPORT std::vector<bool> downloaded_pieces(piece_engine const& e);
}

#endif // PIECESTREAM_PIECE_ENGINE_HPP_INCLUDED
