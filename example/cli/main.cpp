#include "cloud/azure.hpp"
#include "cloud/azure_block_blob.hpp"
#include "network/http_client.hpp"
#include "rpc/client.hpp"
#include "rpc/dispatcher.hpp"
#include "rpc/list_command.hpp"
#include "transfer/config.hpp"
#include "transfer/job_manager.hpp"
#include "utils/log.hpp"
#include <chrono>
#include <csignal>
#include <cstring>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
using namespace blobcopy;
//---------------------------------------------------------------------------
static string destinationFor(const string& prefix, const string& source)
// The destination url of a source below the prefix, a sas query stays at the end
{
    auto queryPos = prefix.find('?');
    auto path = prefix.substr(0, queryPos);
    auto query = queryPos == string::npos ? string() : prefix.substr(queryPos);
    if (!path.empty() && path.back() == '/')
        path.pop_back();
    return path + "/" + cloud::Azure::encodePath(filesystem::path(source).filename().string()) + query;
}
//---------------------------------------------------------------------------
static int copy(const vector<string>& sources, const string& destinationPrefix, transfer::Config config, const string& withStatus)
// Upload the sources as one job and wait for it
{
    utils::Log::engine()->set_level(utils::Log::toSpdlog(config.logLevel));
    auto factory = make_shared<cloud::AzureBlockBlobFactory>(make_shared<network::HttpClient>(), cloud::AzureBlockBlobFactory::secretFromEnvironment());
    transfer::JobManager manager(config, factory);
    rpc::EngineDispatcher dispatcher(manager);
    rpc::Client client(dispatcher);
    rpc::ListCommand list(client, cout);

    transfer::JobPartOrder order;
    order.jobId = transfer::JobID::generate();
    order.partNumber = 0;
    order.isFinalPart = true;
    order.logLevel = config.logLevel;
    for (auto& source : sources) {
        transfer::TransferDescriptor descriptor;
        descriptor.source = source;
        descriptor.destination = destinationFor(destinationPrefix, source);
        descriptor.sourceSize = filesystem::file_size(source);
        descriptor.blockSize = config.defaultBlockSize;
        order.transfers.push_back(move(descriptor));
    }

    auto jobId = order.jobId.toString();
    auto submitted = client.submitJobPart(order);
    if (!submitted.errorMessage.empty()) {
        cerr << "submitting the job failed: " << submitted.errorMessage << endl;
        return 1;
    }
    cout << "job " << jobId << " submitted with " << sources.size() << " transfers" << endl;

    // Print the progress every two seconds
    auto lastPrint = chrono::steady_clock::now();
    while (!manager.jobDone(order.jobId)) {
        this_thread::sleep_for(chrono::milliseconds(200));
        if (chrono::steady_clock::now() - lastPrint >= chrono::seconds(2)) {
            list.run({jobId, ""});
            lastPrint = chrono::steady_clock::now();
        }
    }
    list.run({jobId, ""});
    if (!withStatus.empty() && !list.run({jobId, withStatus}))
        return 1;

    auto summary = client.listJobProgressSummary(order.jobId);
    return summary.errorMessage.empty() && !summary.summary.transfersFailed && !summary.summary.transfersCancelled ? 0 : 1;
}
//---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    string helpText = "blobcopy_cli copy source... destinationPrefix [OPTIONS]\n";
    helpText += "blobcopy_cli list [jobId] [--with-status status]\n\n";
    helpText += "destinationPrefix: http(s)://host[:port]/container[/path][?sas]\n\n";
    helpText += "OPTIONS:\n";
    helpText += "-s blockSize in bytes (default: 8 MiB)\n";
    helpText += "-c concurrent chunk workers (default: 32)\n";
    helpText += "-b bandwidth in Mbit/s (default: 0, unlimited)\n";
    helpText += "-l log level [none, error, warning, info, debug]\n";
    helpText += "-o log directory for the job logs\n";
    helpText += "--with-status status [NotStarted, InProgress, Complete, Failed, Cancelled]\n\n";
    helpText += "The shared key is read from BLOBCOPY_ACCOUNT_NAME and BLOBCOPY_ACCOUNT_KEY\n";

    if (argc < 2 || (strcmp(argv[1], "copy") && strcmp(argv[1], "list"))) {
        cerr << helpText << endl;
        return -1;
    }

    // Writes to closed connections are reported as errors
    signal(SIGPIPE, SIG_IGN);

    try {
        auto config = transfer::Config::fromEnvironment();
        vector<string> positional;
        string withStatus;
        for (auto i = 2; i < argc; i++) {
            if (argv[i][0] != '-') {
                positional.emplace_back(argv[i]);
                continue;
            }
            if ((i + 1) >= argc) {
                cerr << helpText << endl;
                return -1;
            }
            if (!strcmp(argv[i], "-s")) {
                config.defaultBlockSize = transfer::Config::parseUnsigned("-s", argv[++i]);
            } else if (!strcmp(argv[i], "-c")) {
                config.chunkWorkers = static_cast<unsigned>(transfer::Config::parseUnsigned("-c", argv[++i]));
            } else if (!strcmp(argv[i], "-b")) {
                config.bandwidthMbps = transfer::Config::parseUnsigned("-b", argv[++i]);
            } else if (!strcmp(argv[i], "-l")) {
                config.logLevel = utils::Log::parseLevel(argv[++i]);
            } else if (!strcmp(argv[i], "-o")) {
                config.logDirectory = argv[++i];
            } else if (!strcmp(argv[i], "--with-status")) {
                withStatus = argv[++i];
            } else {
                cerr << helpText << endl;
                return -1;
            }
        }
        config.validate();

        if (!strcmp(argv[1], "list")) {
            // Without persistence a fresh engine only knows its own jobs
            transfer::JobManager manager(config, make_shared<cloud::AzureBlockBlobFactory>(make_shared<network::HttpClient>(), nullopt));
            rpc::EngineDispatcher dispatcher(manager);
            rpc::Client client(dispatcher);
            rpc::ListCommand list(client, cout);
            return list.run({positional.empty() ? string() : positional.front(), withStatus}) ? 0 : 1;
        }

        if (positional.size() < 2) {
            cerr << helpText << endl;
            return -1;
        }
        auto destinationPrefix = positional.back();
        positional.pop_back();
        return copy(positional, destinationPrefix, config, withStatus);
    } catch (const exception& e) {
        cerr << "blobcopy failed: " << e.what() << endl;
        return -1;
    }
}
//---------------------------------------------------------------------------
