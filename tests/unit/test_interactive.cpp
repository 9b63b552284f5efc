/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * test_interactive.cpp
*/

#include <gtest/gtest.h>

#include <taconv.h>
#include <interactive.h>

#include <jsoncpp/json/json.h>

static Json::Value parse_json(const string& json)
{
	Json::CharReaderBuilder builder;
	unique_ptr<Json::CharReader> reader(builder.newCharReader());
	Json::Value root;
	string errs;

	EXPECT_TRUE(reader->parse(json.data(), json.data() + json.length(), &root, &errs)) << json << " " << errs;

	return root;
}

class CommandToJson : public ::testing::Test
{
protected:
	void SetUp() override
	{
		g_params.default_decimals = 6;
		g_params.output_buffer_size = 1024;
	}
};

TEST_F(CommandToJson, ShortNamesMapToFullNames)
{
	auto root = parse_json(command_to_json({ "multiply", "100", "0.5" }));

	ASSERT_TRUE(root.isMember("amount-multiply"));
	EXPECT_EQ(root["amount-multiply"]["amount"].asString(), "100");
	EXPECT_EQ(root["amount-multiply"]["factor"].asString(), "0.5");

	root = parse_json(command_to_json({ "magnitude", "-12345" }));
	EXPECT_EQ(root["amount-magnitude"]["amount"].asString(), "-12345");

	root = parse_json(command_to_json({ "approximate", "12345", "2" }));
	EXPECT_EQ(root["amount-approximate"]["factor"].asString(), "2");
}

TEST_F(CommandToJson, FullNamesAccepted)
{
	auto root = parse_json(command_to_json({ "amount-format", "1234", "2" }));

	ASSERT_TRUE(root.isMember("amount-format"));
	EXPECT_EQ(root["amount-format"]["decimals"].asString(), "2");
}

TEST_F(CommandToJson, DefaultDecimalsFilledIn)
{
	auto root = parse_json(command_to_json({ "parse", "1.5" }));
	EXPECT_EQ(root["amount-parse"]["decimals"].asInt(), 6);
	EXPECT_EQ(root["amount-parse"]["value"].asString(), "1.5");

	g_params.default_decimals = 0;
	root = parse_json(command_to_json({ "format", "123" }));
	EXPECT_EQ(root["amount-format"]["decimals"].asInt(), 0);
}

TEST_F(CommandToJson, FinalFlagWords)
{
	const char *yes[] = { "final", "true", "1" };
	for (auto w : yes)
	{
		auto root = parse_json(command_to_json({ "normalize", "12.", w }));
		EXPECT_TRUE(root["decimal-normalize"]["final"].asBool()) << w;
	}

	auto root = parse_json(command_to_json({ "normalize", "12.", "false" }));
	EXPECT_FALSE(root["decimal-normalize"]["final"].asBool());

	root = parse_json(command_to_json({ "normalize", "12." }));
	EXPECT_FALSE(root["decimal-normalize"].isMember("final"));
}

TEST_F(CommandToJson, JsonParametersPassedThrough)
{
	auto root = parse_json(command_to_json({ "format", R"({"amount":"0xff","decimals":1})" }));

	ASSERT_TRUE(root["amount-format"].isObject());
	EXPECT_EQ(root["amount-format"]["amount"].asString(), "0xff");
	EXPECT_EQ(root["amount-format"]["decimals"].asInt(), 1);
	EXPECT_EQ(root["amount-format"].size(), 2U);

	EXPECT_THROW(command_to_json({ "format", "{not json" }), runtime_error);
}

TEST_F(CommandToJson, WrongParameterCount)
{
	EXPECT_THROW(command_to_json({ "format" }), runtime_error);
	EXPECT_THROW(command_to_json({ "multiply", "100" }), runtime_error);
	EXPECT_THROW(command_to_json({ "magnitude", "1", "2" }), runtime_error);

	try
	{
		command_to_json({ "format" });
		FAIL() << "no exception";
	}
	catch (const runtime_error& e)
	{
		EXPECT_NE(string(e.what()).find("wrong number of parameters"), string::npos) << e.what();
	}
}

TEST_F(CommandToJson, UnrecognizedCommand)
{
	try
	{
		command_to_json({ "divide", "1", "2" });
		FAIL() << "no exception";
	}
	catch (const runtime_error& e)
	{
		EXPECT_NE(string(e.what()).find("unrecognized command \"divide\""), string::npos) << e.what();
	}
}

TEST_F(CommandToJson, EmptyCommand)
{
	EXPECT_EQ(command_to_json(vector<string>()), "");
}

TEST_F(CommandToJson, ExecutesThroughLibrary)
{
	EXPECT_EQ(do_json_command(command_to_json({ "parse", "1.5" })), 0);
	EXPECT_EQ(do_json_command(command_to_json({ "parse", "1.1234567" })), -1);

	g_params.output_buffer_size = 64;
	EXPECT_EQ(do_json_command(command_to_json({ "format", "1", "100" })), 1);
}
