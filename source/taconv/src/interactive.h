/*
 * TokenAmount numeric conversion library
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * interactive.h
*/

#pragma once

string command_to_json(const vector<string>& cmd);

string command_line_to_json();

void do_interactive();

int do_json_command(const string& json);
