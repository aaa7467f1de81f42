//[ x11_info_example
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "myssh.hpp"

// print an address the way xauth list does
std::string format_address(const myssh::xauth_entry &entry)
{
	std::ostringstream s;

	switch (entry.family)
	{
		case myssh::family_local:
			s << std::string(entry.address.begin(), entry.address.end()) << "/unix";
			break;

		case myssh::family_internet:
			for (std::size_t i = 0; i < entry.address.size(); ++i)
				s << (i ? "." : "") << static_cast<int>(entry.address[i]);
			break;

		case myssh::family_internet6:
			s << '[' << std::hex;
			for (std::size_t i = 0; i + 1 < entry.address.size(); i += 2)
				s << (i ? ":" : "") << (entry.address[i] << 8 | entry.address[i + 1]);
			s << ']';
			break;

		case myssh::family_wild:
			s << '*';
			break;

		default:
			s << "#family " << entry.family;
			break;
	}

	return s.str();
}

int main(int argc, char *const argv[])
{
	if (argc > 3)
	{
		std::cerr << "usage: x11-info [display [authority-file]]\n";
		exit(1);
	}

	/*<< Start with the options as taken from the environment >>*/
	auto options = myssh::x11_options::from_environment();
	if (argc > 1)
		options.display = argv[1];
	if (argc > 2)
		options.authority_file = argv[2];

	if (not options.enabled())
	{
		std::cerr << "No display, set DISPLAY or pass one on the command line\n";
		exit(1);
	}

	try
	{
		/*<< Parse the display name and find out where its X server lives >>*/
		auto display = myssh::parse_display(options.display);
		auto target = myssh::resolve_display(display, options.socket_prefix);

		std::cout << "display: " << display.to_string() << '\n'
				  << "host:    " << (display.host.empty() ? "(local)" : display.host) << '\n'
				  << "number:  " << display.number << '\n'
				  << "screen:  " << (display.screen.empty() ? "(default)" : display.screen) << '\n'
				  << "target:  " << target.to_string() << '\n';

		/*<< List the authority entries, or ask xauth for the cookie >>*/
		if (not options.authority_file.empty())
		{
			std::ifstream file(options.authority_file, std::ios::binary);
			if (not file.is_open())
				throw std::runtime_error("cannot open " + options.authority_file);

			myssh::xauth_reader reader(file);
			for (auto &entry : reader)
			{
				std::cout << format_address(entry) << ':' << entry.number << "  " << entry.name << "  ";
				for (auto b : entry.data)
					std::cout << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
				std::cout << std::dec << '\n';
			}
		}
		else
		{
			auto cookie = myssh::fetch_xauth_cookie(options.xauth_location, options.display);
			std::cout << "cookie:  " << cookie.size() << " bytes from " << options.xauth_location << '\n';
		}

		/*<< Try to reach the X server >>*/
		asio_ns::io_context io_context;

		auto connected = asio_ns::co_spawn(io_context,
			myssh::async_connect_display(io_context.get_executor(), target), asio_ns::use_future);

		io_context.run();

		connected.get()->close();
		std::cout << "connect: ok\n";
	}
	catch (const std::exception &e)
	{
		std::cerr << e.what() << '\n';
		exit(1);
	}

	return 0;
}
//]
