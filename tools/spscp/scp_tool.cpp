#include "scp_tool.hpp"
#include "progress_printer.hpp"
#include "scp/client/scp_client.hpp"
#include "scp/process/process_channel.hpp"

#include <asio.hpp>

#include <iostream>
#include <thread>

namespace securepath::scp {

spscp_commands::spscp_commands() {
	add(help, "help", "", "show help");
	add(verbose, "verbose", "v", "verbose logging");
	add(very_verbose, "very-verbose", "vv", "very verbose logging");
	add(quiet, "quiet", "q", "do not show progress");
	add(host, "host", "h", "host to connect");
	add(port, "port", "p", "port to connect");
	add(user, "user", "u", "username to connect");
	add(ssh_path, "ssh", "", "ssh client program");
	add(scp_path, "scp-path", "", "scp program on the remote host");
	add(local, "local", "", "run scp on this machine (for testing)");
	add(recursive, "recursive", "r", "copy directories recursively");
	add(get, "get", "g", "copy remote path to local path: --get <remote> <local>");
	add(put, "put", "", "copy local path to remote path: --put <local> <remote>");
	add(config_file, "config", "c", "options file");
}

void spscp_commands::validate() const {
	if(get.empty() == put.empty()) {
		throw invalid_argument("exactly one of --get and --put is required");
	}
	if(!get.empty() && get.size() != 2) {
		throw invalid_argument("--get needs remote and local path");
	}
	if(!put.empty() && put.size() != 2) {
		throw invalid_argument("--put needs local and remote path");
	}
	if(host.empty() && !local) {
		throw invalid_argument("--host is required");
	}
	if(!valid()) {
		throw invalid_argument("invalid scp configuration");
	}
}

spscp_tool::spscp_tool(spscp_commands const& c, std::ostream& log_out)
: commands_(c)
, log_out_(log_out)
{
}

int spscp_tool::run() {
	logger::type level = logger::type(logger::error | logger::warning);
	if(commands_.very_verbose) {
		level = logger::log_all;
	} else if(commands_.verbose) {
		level = logger::type(level | logger::info | logger::debug);
	}
	stream_logger log(log_out_, level);

	std::vector<std::string> prefix = commands_.local
		? std::vector<std::string>{"/bin/sh", "-c"}
		: ssh_argv_prefix(commands_.ssh_path, commands_.host, commands_.port, commands_.user);

	process_channel_factory factory(log, prefix);
	scp_client client(factory, log, commands_);

	progress_printer progress(log_out_);
	if(!commands_.quiet) {
		client.set_observer(&progress);
	}

	std::stop_source stop;

	// signals are handled in separate thread that only requests stop for the transfer
	asio::io_context io_context;
	asio::signal_set signals(io_context, SIGINT, SIGTERM);
	signals.async_wait(
		[&](asio::error_code const& ec, int signal) {
			if(!ec) {
				log.log(logger::info, "received signal {}, cancelling", signal);
				stop.request_stop();
			}
		});
	std::thread signal_thread([&] { io_context.run(); });

	scp_error err;
	if(!commands_.get.empty()) {
		auto const& remote = commands_.get[0];
		auto const& local = commands_.get[1];
		if(commands_.recursive) {
			err = client.receive_dir(remote, local, {}, stop.get_token());
		} else {
			err = client.receive_file(remote, local, stop.get_token());
		}
	} else {
		auto const& local = commands_.put[0];
		auto const& remote = commands_.put[1];
		if(commands_.recursive) {
			err = client.send_dir(local, remote, {}, stop.get_token());
		} else {
			err = client.send_file(local, remote, stop.get_token());
		}
	}

	io_context.stop();
	signal_thread.join();

	if(err) {
		log.log(logger::error, "{}", to_string(err));
		return err.code() == scp_cancelled ? tool_cancelled : tool_failed;
	}
	return tool_ok;
}

}
