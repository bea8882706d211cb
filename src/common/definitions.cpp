/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Protocol constants and mobile application presets
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "definitions.hpp"


namespace midea {
namespace app {

static const tAppPreset presets[] = {
	{
		"NetHome Plus",
		"3742e9e5842d4ad59c2db887e12449f9",
		"1017",
		"https://mapp.appsmb.com/v1/",
		"xhdiwjnchekd4d512chdjx5d8e4c394D2D7S",
		"",
		"",
		""
	},
	{
		"Midea Air",
		"ff0cf6f5f0c3471de36341cab3f7a9af",
		"1117",
		"https://mapp.appsmb.com/v1/",
		"xhdiwjnchekd4d512chdjx5d8e4c394D2D7S",
		"",
		"",
		""
	},
	{
		"MSmartHome",
		"ac21b9f9cbfe4ca5a88562ef25e2b768",
		"1010",
		"https://mp-prod.appsmb.com/mas/v5/app/proxy?alias=",
		"xhdiwjnchekd4d512chdjx5d8e4c394D2D7S",
		"meicloud",
		"PROD_VnoClJI9aikS8dyy",
		"v5"
	}
};


const tAppPreset* find(const std::string &szName)
{
	for (const auto &preset : presets)
	{
		if (preset.name == szName)
			return &preset;
	}
	return nullptr;
}

const tAppPreset* get_default()
{
	return &presets[0];
}

}; // namespace app
}; // namespace midea
