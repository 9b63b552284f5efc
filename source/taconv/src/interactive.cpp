/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * interactive.cpp
*/

#include "taconv.h"
#include "interactive.h"

#include <TAapi.h>
#include <jsoncpp/json/json.h>

struct command_def
{
	const char *shortname;
	const char *fullname;
	const char *params[2];
	unsigned nrequired;
};

static const command_def command_defs[] =
{
	{ "normalize",		"decimal-normalize",	{ "value", "final" },		1 },
	{ "format",			"amount-format",		{ "amount", "decimals" },	1 },
	{ "parse",			"amount-parse",			{ "value", "decimals" },	1 },
	{ "multiply",		"amount-multiply",		{ "amount", "factor" },		2 },
	{ "approximate",	"amount-approximate",	{ "amount", "factor" },		1 },
	{ "magnitude",		"amount-magnitude",		{ "amount", NULL },			1 },
};

static const command_def* find_command(const string& name)
{
	for (auto& def : command_defs)
	{
		if (name == def.shortname || name == def.fullname)
			return &def;
	}

	return NULL;
}

static string to_json_text(const Json::Value& root)
{
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "";

	return Json::writeString(builder, root);
}

static bool is_true_word(const string& p)
{
	return p == "final" || p == "true" || p == "1";
}

string command_to_json(const vector<string>& cmd)
{
	if (!cmd.size())
		return string();

	auto def = find_command(cmd[0]);
	if (!def)
		throw runtime_error(string("unrecognized command \"") + cmd[0] + "\"");

	unsigned nparams = 0;
	while (nparams < 2 && def->params[nparams])
		++nparams;

	if (cmd.size() - 1 == 1 && cmd[1].length() && cmd[1][0] == '{')
	{
		// parameters given as a JSON object are passed through

		Json::CharReaderBuilder builder;
		unique_ptr<Json::CharReader> reader(builder.newCharReader());
		Json::Value params;
		string errs;

		if (!reader->parse(cmd[1].data(), cmd[1].data() + cmd[1].length(), &params, &errs) || !params.isObject())
			throw runtime_error(string("invalid JSON parameters for \"") + cmd[0] + "\": " + errs);

		Json::Value root;
		root[def->fullname] = params;

		return to_json_text(root);
	}

	if (cmd.size() - 1 < def->nrequired || cmd.size() - 1 > nparams)
		throw runtime_error(string("wrong number of parameters for \"") + cmd[0] + "\"");

	Json::Value params(Json::objectValue);

	for (unsigned i = 1; i < cmd.size(); ++i)
	{
		string key = def->params[i - 1];

		if (key == "final")
			params[key] = is_true_word(cmd[i]);
		else
			params[key] = cmd[i];
	}

	if (def->params[1] && string(def->params[1]) == "decimals" && !params.isMember("decimals"))
		params["decimals"] = g_params.default_decimals;

	Json::Value root;
	root[def->fullname] = params;

	return to_json_text(root);
}

string command_line_to_json()
{
	if (!g_params.config_options.count("command"))
		return string();

	auto cmd = g_params.config_options["command"].as<vector<string>>();

	return command_to_json(cmd);
}

static vector<string> split_input(const string& input)
{
	vector<string> tokens;
	istringstream is(input);
	string token;

	while (is >> token)
		tokens.push_back(token);

	return tokens;
}

void do_interactive()
{
	while (true)
	{
		string input;

		while (!input.length())
		{
			cerr << TAEXENAME "> ";

			if (!cin.good()) return;

			getline(cin, input);

			if (!cin.good() && !input.length()) return;

			input = trim_whitespace(input);
		}

		if (input == "stop" || input == "STOP" || input == "quit" || input == "exit")
			return;

		if (input == "?" || input == "help" || input == "HELP")
		{
			cerr <<
			"command [params ...]\n"
			"\n"
			"normalize <value> [final]\n"
			"format <amount> [decimals]\n"
			"parse <value> [decimals]\n"
			"multiply <amount> <factor>\n"
			"approximate <amount> [factor]\n"
			"magnitude <amount>\n"
			"\n"
			"- Parameters are separated by spaces.\n"
			"- A line starting with { is executed as a JSON command.\n"
			"- stop exits.\n"
			;
			cerr << endl;

			continue;
		}

		string json;

		if (input[0] == '{')
			json = input;
		else
		{
			try
			{
				json = command_to_json(split_input(input));
			}
			catch (const exception& e)
			{
				cerr << "ERROR: " << e.what() << endl;

				continue;
			}
		}

		do_json_command(json);
	}
}

int do_json_command(const string& json)
{
	if (!json.size())
		return 0;

	BOOST_LOG_TRIVIAL(debug) << "Executing JSON command " << json;

	vector<char> output(g_params.output_buffer_size);

	auto rc = TAAmount_JsonCmd(json.c_str(), output.data(), output.size());

	if (rc)
		cerr << "ERROR: " << output.data() << endl;
	else
		cout << output.data() << endl;

	return rc;
}
