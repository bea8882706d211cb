/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Jsoncpp bridge for the Midea cloud client
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#ifndef _MideaJsonBridge
#define _MideaJsonBridge

#include <string>
#include <memory>
#include <json/json.h>


namespace midea {


static int parse_json_string(const std::string &szInput, Json::Value &jOutput)
{
	if (szInput.empty())
		return -1;
	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	if (!jReader->parse(szInput.c_str(), szInput.c_str() + szInput.size(), &jOutput, nullptr))
		return -1;
	if (!jOutput.isObject())
		return 1;
	return 0;
}


static std::string json_as_string(const Json::Value &jValue)
{
	if (jValue.isNull())
		return "";
	if (jValue.isString())
		return jValue.asString();
	Json::StreamWriterBuilder jWriter;
	jWriter["indentation"] = "";
	return Json::writeString(jWriter, jValue);
}

}; // namespace midea

#endif
