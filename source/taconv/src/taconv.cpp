/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * taconv.cpp
*/

#include "taconv.h"
#include "interactive.h"

#include <amounts.h>
#include <jsonapi.h>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/errors.hpp>

static void do_show_config()
{
	cout << TAAPPNAME " v" TAVERSION << endl;
	cout << endl;
	cout << "Conversion settings:" << endl;
	cout << "   default decimals = " << g_params.default_decimals << endl;
	cout << "   output buffer bytes = " << g_params.output_buffer_size << endl;
	cout << "   interactive = " << yesno(g_params.interactive) << endl;
	cout << endl;
	cout << "Trace output settings:" << endl;
	cout << "   trace level = " << g_params.trace_level << " (" << trace_level_name(g_params.trace_level) << ")" << endl;
	cout << "   trace amount conversions = " << yesno(g_params.trace_amounts) << endl;
	cout << "   trace JSON commands = " << yesno(g_params.trace_jsoncmd) << endl;
	cout << endl;
}

static void check_config_values()
{
	if (g_params.default_decimals < 0 || g_params.default_decimals > AMOUNT_DECIMALS_MAX)
		throw range_error("decimals value not in valid range");

	if (g_params.output_buffer_size < OUTPUT_BUFFER_MIN || g_params.output_buffer_size > OUTPUT_BUFFER_MAX)
		throw range_error("output-buffer value not in valid range");

	if (g_params.trace_level < 0 || g_params.trace_level > TRACE_LEVEL_MAX)
		throw range_error("trace level not in valid range");
}

static int process_options(int argc, char **argv)
{
	namespace po = boost::program_options;

	po::options_description basic_options("BASIC OPTIONS");
	basic_options.add_options()
		("help", "Display this message.")
		("show-config", "Show configuration information.")
		("dry-run", "Show the JSON command built from the command line and exit.")
		("interactive", "Read commands from standard input after executing the command line.")
		;

	po::options_description advanced_options("ADVANCED OPTIONS", 99, 0);
	advanced_options.add_options()
		("config", po::value<string>(), "Path to file with additional configuration options.")
		("decimals", po::value<int>(&g_params.default_decimals)->default_value(DEFAULT_DECIMALS), "Decimals used by the format and parse commands when none is given (0 to " STRINGIFY(AMOUNT_DECIMALS_MAX) ").")
		("output-buffer", po::value<int>(&g_params.output_buffer_size)->default_value(DEFAULT_OUTPUT_BUFFER), "Size in bytes of the command result buffer.")
		("trace", po::value<int>(&g_params.trace_level)->default_value(DEFAULT_TRACE_LEVEL), "Trace level (0=none, 1=fatal, 2=errors, 3=warnings, 4=info, 5=debug, 6=trace)")
		("trace-amounts", po::value<bool>(&g_params.trace_amounts)->default_value(0), "Trace amount conversions")
		("trace-jsoncmd", po::value<bool>(&g_params.trace_jsoncmd)->default_value(0), "Trace JSON commands")
	;

	po::options_description hidden_options("");
	hidden_options.add_options()
		("command", po::value< vector<string> >())
	;

	po::positional_options_description positional_options;
	positional_options.add("command", -1);

	po::options_description all;
	all.add(basic_options).add(advanced_options).add(hidden_options);

	po::store(po::command_line_parser(argc, argv).options(all).positional(positional_options).run(), g_params.config_options);

	if (g_params.config_options.count("help"))
	{
		cerr << TAAPPNAME " v" TAVERSION << endl;
		cerr << "\nUsage: " << argv[0] << " [options] [command] [params...]" << endl;
		cerr << "   or: " << argv[0] << " [options] [command] [params...] --interactive\n" << endl;
		cerr << "Commands:" << endl;
		cerr << "   normalize <value> [final]" << endl;
		cerr << "   format <amount> [decimals]" << endl;
		cerr << "   parse <value> [decimals]" << endl;
		cerr << "   multiply <amount> <factor>" << endl;
		cerr << "   approximate <amount> [factor]" << endl;
		cerr << "   magnitude <amount>" << endl;
		cerr << endl;
		cerr << basic_options << endl;
		cerr << advanced_options << endl;

		return 1;
	}

	if (g_params.config_options.count("config"))
	{
		ifstream fs;
		auto fname = g_params.config_options.at("config").as<string>();
		fs.open(fname, fstream::in);
		if(!fs.is_open())
			throw runtime_error(string("Unable to open config file \"") + fname + "\"");

		po::store(po::parse_config_file(fs, all), g_params.config_options);
	}

	po::notify(g_params.config_options);

	g_params.interactive = g_params.config_options.count("interactive");

	check_config_values();

	set_trace_level(g_params.trace_level);

	g_trace_amounts = g_params.trace_amounts;
	g_trace_jsoncmd = g_params.trace_jsoncmd;

	if (g_params.config_options.count("show-config"))
		do_show_config();

	return 0;
}

int main(int argc, char **argv)
{
	g_params.trace_level = DEFAULT_TRACE_LEVEL;
	set_trace_level(g_params.trace_level);

	string command_line_json;

	try
	{
		auto rc = process_options(argc, argv);
		if (rc) return rc;

		command_line_json = command_line_to_json();
	}
	catch (const exception& e)
	{
		cerr << "ERROR: " << e.what() << endl;
		return -1;
	}

	if (g_params.config_options.count("dry-run"))
	{
		if (command_line_json.size())
			cerr << "JSON command to execute:\n" << command_line_json << endl;

		return 1;
	}

	if (!command_line_json.size() && !g_params.interactive && !g_params.config_options.count("show-config"))
	{
		cerr << "No command given; use --help for usage" << endl;
		return -1;
	}

	int result_code = 0;

	try
	{
		if (command_line_json.size())
			result_code = do_json_command(command_line_json);

		if (g_params.interactive)
			do_interactive();
	}
	catch (const exception& e)
	{
		BOOST_LOG_TRIVIAL(fatal) << "taconv exception " << e.what();
		result_code = -1;
	}

	return result_code;
}
