#include "progress_printer.hpp"

#include <iomanip>
#include <ostream>

namespace securepath::scp {

progress_printer::progress_printer(std::ostream& out)
: out_(out)
{
}

void progress_printer::print(std::string_view name, std::uint64_t transferred, std::uint64_t size, bool done) {
	int percent = size ? int(transferred * 100 / size) : 100;
	if(percent == last_percent_ && !done) {
		return;
	}
	last_percent_ = percent;
	out_ << "\r" << name << " " << std::setw(3) << percent << "% " << transferred << "/" << size;
	if(done) {
		out_ << "\n";
	}
	out_.flush();
}

void progress_printer::on_file_begin(std::string_view name, std::uint64_t size) {
	last_percent_ = -1;
	transferred_ = 0;
	size_ = size;
	print(name, 0, size, false);
}

void progress_printer::on_file_progress(std::string_view name, std::uint64_t transferred, std::uint64_t size) {
	transferred_ = transferred;
	print(name, transferred, size, false);
}

void progress_printer::on_file_end(std::string_view name, scp_error const& error) {
	print(name, transferred_, size_, true);
	if(error) {
		out_ << name << ": " << error.message() << "\n";
	}
}

}
