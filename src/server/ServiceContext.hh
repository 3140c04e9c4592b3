/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the chunky_otter
	distribution for more details.
*/

#pragma once

#include <chrono>

namespace cot {

class BearerToken;
class ChunkGrant;
class ChunkResolver;
class Configuration;
class IngestService;
class JobRegistry;
class MetadataStore;

/// Long lived services shared by all request handlers. Owned by Server.
struct ServiceContext
{
	const Configuration&    cfg;
	MetadataStore&          metadata;
	const ChunkResolver&    resolver;
	const ChunkGrant&       grants;
	const BearerToken&      tokens;
	JobRegistry&            jobs;
	IngestService&          ingest;

	std::chrono::steady_clock::time_point started{std::chrono::steady_clock::now()};
};

} // end of namespace cot
