#include "scp_session.hpp"
#include "scp/common/util.hpp"

namespace securepath::scp {

std::string_view to_string(session_state s) {
	using enum session_state;
	switch(s) {
		case created: return "created";
		case started: return "started";
		case closed:  return "closed";
	}
	return "unknown";
}

std::string make_scp_command(scp_config const& config, session_options const& opts) {
	std::string flags = "-";
	flags += opts.direction == transfer_direction::from_remote ? 'f' : 't';
	if(config.preserve) {
		flags += 'p';
	}
	if(opts.recursive) {
		flags += 'r';
	}
	if(opts.target_is_dir) {
		flags += 'd';
	}
	return config.scp_path + " " + flags + " " + escape_shell_arg(opts.remote_path);
}

scp_session::scp_session(logger& log, channel_factory& factory, scp_config const& config, session_options opts)
: log_(log, "[" + make_scp_command(config, opts) + "] ")
, factory_(factory)
, config_(config)
, options_(std::move(opts))
, command_(make_scp_command(config_, options_))
{
}

scp_session::~scp_session()
{
	close();
}

session_state scp_session::state() const {
	std::lock_guard l{mutex_};
	return state_;
}

bool scp_session::cancelled() const {
	std::lock_guard l{mutex_};
	return cancelled_;
}

in_stream& scp_session::remote_out() {
	SPSCP_ASSERT(channel_, "session not started");
	return channel_->output();
}

out_stream& scp_session::remote_in() {
	SPSCP_ASSERT(channel_, "session not started");
	return channel_->input();
}

scp_error scp_session::start() {
	{
		std::lock_guard l{mutex_};
		if(state_ != session_state::created) {
			return scp_error{scp_transport_error, simple_format("cannot start session in state {}", to_string(state_))};
		}
	}

	std::unique_ptr<command_channel> ch;
	auto err = factory_.open_channel(ch);
	if(err) {
		return err.wrap("failed to open channel");
	}
	SPSCP_ASSERT(ch, "channel factory returned no channel");

	log_.log(logger::info, "starting remote command");
	err = ch->start(command_);
	if(err) {
		ch->close();
		return err.wrap("failed to start remote command");
	}

	std::lock_guard l{mutex_};
	channel_ = std::move(ch);
	if(state_ == session_state::created) {
		state_ = session_state::started;
	} else {
		// closed while starting
		channel_->close();
		return scp_error{scp_transport_error, "session closed while starting"};
	}
	return {};
}

scp_error scp_session::finish() {
	if(state() != session_state::started) {
		return scp_error{scp_transport_error, "session is not running"};
	}

	auto err = channel_->close_input();
	if(err) {
		return err.wrap("failed to close remote input");
	}

	err = channel_->wait();
	if(err) {
		return err.wrap("remote command failed");
	}
	log_.log(logger::info, "remote command finished");
	return {};
}

void scp_session::close() {
	command_channel* ch{};
	{
		std::lock_guard l{mutex_};
		if(state_ == session_state::closed) {
			return;
		}
		state_ = session_state::closed;
		ch = channel_.get();
	}
	log_.log(logger::debug, "closing session");
	if(ch) {
		ch->close();
	}
}

void scp_session::cancel() {
	{
		std::lock_guard l{mutex_};
		cancelled_ = true;
	}
	log_.log(logger::info, "cancel requested");
	close();
}

scp_error scp_session::run(std::stop_token stop, handler const& h) {
	if(stop.stop_requested()) {
		return scp_error{scp_cancelled, "transfer cancelled before start"};
	}

	auto err = start();
	if(!err) {
		// closes the session from the thread requesting stop
		std::stop_callback on_stop(stop, [this] { cancel(); });

		err = h(*this);
		if(!err) {
			err = finish();
		}
	}

	if(err) {
		log_.log(logger::error, "{}", err.message());
		if(cancelled()) {
			err = err.with_code(scp_cancelled).wrap("transfer cancelled");
		}
	}

	close();
	return err;
}

}
