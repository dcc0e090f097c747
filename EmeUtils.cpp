/*
 * If not stated otherwise in this file or this component's license file the
 * following copyright and licenses apply:
 *
 * Copyright 2018 RDK Management
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
*/

/**
 * @file EmeUtils.cpp
 * @brief Common utility functions
 */

#include "EmeUtils.h"
#include <time.h>
#include <stdlib.h>
#include <functional>

/**
 * @brief Trim a string
 */
void trim(std::string& src)
{
	size_t first = src.find_first_not_of(" \n\r\t\f\v");
	if (first != std::string::npos)
	{
		size_t last = src.find_last_not_of(" \n\r\t\f\v");
		std::string dst = src.substr(first, (last - first + 1));
		src = dst;
	}
	else
	{
		src.clear();
	}
}

bool SplitOnce(const std::string &src, char delim, std::string &head, std::string &tail)
{
	size_t pos = src.find(delim);
	if (pos == std::string::npos)
	{
		head = src;
		tail.clear();
		return false;
	}
	head = src.substr(0, pos);
	tail = src.substr(pos + 1);
	return true;
}

static std::hash<std::thread::id> std_thread_hasher;

std::size_t GetPrintableThreadID( const std::thread &t )
{
	return std_thread_hasher( t.get_id() );
}

std::size_t GetPrintableThreadID( void )
{
	return std_thread_hasher( std::this_thread::get_id() );
}

/**
 * @brief support for POSIX threads
 */
std::size_t GetPrintableThreadID( const pthread_t &t )
{
	static std::hash<pthread_t> pthread_hasher;
	return pthread_hasher( t );
}

std::string eme_GetConfigPath( const std::string &filename )
{
	std::string cfgPath;
	const char *ptr = getenv("EME_CFG_DIR");
	if (ptr != nullptr)
	{
		cfgPath = ptr;
		if (filename.rfind("/opt/", 0) == 0)
		{ // skip leading /opt when redirected
			cfgPath += filename.substr(4);
		}
		else
		{
			cfgPath += "/" + filename;
		}
	}
	else
	{
		cfgPath = filename;
	}
	return cfgPath;
}
