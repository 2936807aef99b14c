//
// Copyright (C) 2025  HiPES - Universidade Federal do Paraná
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.
//
/**
 * @file traffic_generator.cpp
 * @brief Implementation of the TrafficGenerator.
 */

#include "traffic_generator.hpp"

TrafficGenerator::TrafficGenerator()
    : sendTo(NULL),
      sendToId(-1),
      requests(0),
      ids(0),
      base(0),
      range(0),
      stride(1),
      randomPattern(false),
      outstanding(NULL),
      sentAddress(NULL),
      sentAt(NULL),
      nextId(0),
      nextAddress(0),
      cycle(0),
      issued(0),
      completed(0),
      inFlight(0),
      errors(0),
      totalLatency(0),
      statNoFreeId(0),
      statBackpressure(0) {}

int TrafficGenerator::Configure(Config config) {
    if (config.ComponentReference("sendTo", &this->sendTo, true)) return 1;

    long requests = 1000;
    long ids = 16;
    long base = 0;
    long range = 4096;
    long stride = 1;
    long seed = 1;
    long bufferSize = 1;
    const char* pattern = "sequential";

    if (config.Integer("requests", &requests)) return 1;
    if (requests < 0) return config.Error("requests", "is not >= 0.");
    if (config.Integer("ids", &ids)) return 1;
    if (ids < 1) return config.Error("ids", "is not >= 1.");
    if (config.Integer("base", &base)) return 1;
    if (config.Integer("range", &range)) return 1;
    if (range < 1) return config.Error("range", "is not >= 1.");
    if (config.Integer("stride", &stride)) return 1;
    if (stride < 1) return config.Error("stride", "is not >= 1.");
    if (config.Integer("seed", &seed)) return 1;
    if (config.Integer("bufferSize", &bufferSize)) return 1;
    if (bufferSize < 0) return config.Error("bufferSize", "is not >= 0.");
    if (config.String("pattern", &pattern)) return 1;

    if (strcmp(pattern, "sequential") == 0) {
        this->randomPattern = false;
    } else if (strcmp(pattern, "random") == 0) {
        this->randomPattern = true;
    } else {
        return config.Error("pattern", "is neither sequential nor random.");
    }

    this->requests = requests;
    this->ids = ids;
    this->base = base;
    this->range = range;
    this->stride = stride;
    // minstd_rand can't take a seed of 0.
    this->generator.seed(seed == 0 ? 1 : seed);

    this->outstanding = new bool[this->ids];
    this->sentAddress = new unsigned long[this->ids];
    this->sentAt = new unsigned long[this->ids];
    for (unsigned long i = 0; i < this->ids; ++i) this->outstanding[i] = false;

    this->PrepareNextAddress();

    this->sendToId = this->sendTo->Connect(bufferSize);
    if (this->sendToId < 0) return 1;

    return 0;
}

void TrafficGenerator::PrepareNextAddress() {
    if (this->randomPattern) {
        this->nextAddress = this->base + this->generator() % this->range;
    } else {
        this->nextAddress =
            this->base + (this->issued * this->stride) % this->range;
    }
}

void TrafficGenerator::Issue() {
    unsigned long id = this->nextId;
    unsigned long tried = 0;
    while (tried < this->ids && this->outstanding[id]) {
        id = (id + 1) % this->ids;
        ++tried;
    }
    if (tried == this->ids) {
        ++this->statNoFreeId;
        return;
    }

    MemoryPacket request;
    memset(&request, 0, sizeof(request));
    request.id = id;
    request.address = this->nextAddress;
    if (this->sendTo->SendRequest(this->sendToId, &request)) {
        ++this->statBackpressure;
        return;
    }

    this->outstanding[id] = true;
    this->sentAddress[id] = request.address;
    this->sentAt[id] = this->cycle;
    this->nextId = (id + 1) % this->ids;
    ++this->inFlight;
    ++this->issued;
    this->PrepareNextAddress();
}

void TrafficGenerator::Check(const MemoryPacket* response) {
    if (response->id >= this->ids || !this->outstanding[response->id]) {
        CAMSIM_ERROR_PRINTF(
            "TrafficGenerator %p: unexpected or duplicated response to id "
            "%lu.\n",
            (void*)this, response->id);
        ++this->errors;
        return;
    }

    const unsigned long address = this->sentAddress[response->id];
    if (response->address != address ||
        response->data != MemoryDataFor(address)) {
        CAMSIM_ERROR_PRINTF(
            "TrafficGenerator %p: id %lu asked for 0x%lx and got 0x%lx from "
            "0x%lx.\n",
            (void*)this, response->id, address, response->data,
            response->address);
        ++this->errors;
    }

    this->outstanding[response->id] = false;
    this->totalLatency += this->cycle - this->sentAt[response->id];
    --this->inFlight;
    ++this->completed;
}

void TrafficGenerator::Clock() {
    MemoryPacket response;
    while (this->sendTo->ReceiveResponse(this->sendToId, &response) == 0) {
        this->Check(&response);
    }

    if (this->issued < this->requests) this->Issue();
    ++this->cycle;
}

bool TrafficGenerator::IsBusy() {
    return this->issued < this->requests || this->inFlight > 0;
}

void TrafficGenerator::PrintStatistics() {
    const double latency =
        this->completed == 0 ? 0 : (double)this->totalLatency / this->completed;
    CAMSIM_LOG_PRINTF(
        "TrafficGenerator %p:\n\tIssued: %lu\n\tCompleted: %lu\n\tErrors: "
        "%lu\n\tAverage latency: %.2f cycles\n\tStalled without a free id: "
        "%lu\n\tStalled by backpressure: %lu\n",
        (void*)this, this->issued, this->completed, this->errors, latency,
        this->statNoFreeId, this->statBackpressure);
    if (this->inFlight > 0) {
        CAMSIM_WARNING_PRINTF(
            "TrafficGenerator %p: %lu requests never got a response.\n",
            (void*)this, this->inFlight);
    }
}

TrafficGenerator::~TrafficGenerator() {
    delete[] this->outstanding;
    delete[] this->sentAddress;
    delete[] this->sentAt;
}

#ifndef NDEBUG

#include <std_components/memory/backing_memory.hpp>

/**
 * @brief Answers every request twice, the second time with broken data.
 */
class StutteringResponder : public Component<MemoryPacket> {
  public:
    virtual int Configure(Config config) {
        (void)config;
        return 0;
    }
    virtual void Clock() {
        MemoryPacket packet;
        for (long i = 0; i < this->GetNumberOfConnections(); ++i) {
            while (this->ReceiveRequestFromConnection(i, &packet) == 0) {
                packet.data = MemoryDataFor(packet.address);
                this->SendResponseToConnection(i, &packet);
                packet.data += 1;
                this->SendResponseToConnection(i, &packet);
            }
        }
    }
    virtual void PrintStatistics() {}
};

static int Run(TrafficGenerator* generator, Linkable* responder, int limit) {
    int cycle = 0;
    while (generator->IsBusy() && cycle < limit) {
        generator->Clock();
        responder->Clock();
        generator->PosClock();
        responder->PosClock();
        ++cycle;
    }
    return cycle;
}

int TestTrafficGenerator() {
    BackingMemory memory;
    TrafficGenerator generator;

    Map<Linkable*> aliases;
    yaml::Parser memoryParser;
    yaml::Parser generatorParser;
    aliases.Insert("memory", &memory);

    if (memory.Configure(
            CreateFakeConfig(&memoryParser, "latency: 3\n", &aliases)) ||
        generator.Configure(CreateFakeConfig(&generatorParser,
                                             "sendTo: *memory\n"
                                             "requests: 50\n"
                                             "ids: 4\n"
                                             "base: 0x400\n"
                                             "range: 64\n"
                                             "pattern: random\n"
                                             "seed: 7\n"
                                             "bufferSize: 4\n",
                                             &aliases))) {
        CAMSIM_ERROR_PRINTF("TestTrafficGenerator %s:%d configure failed\n",
                            __FILE__, __LINE__);
        return 1;
    }

    Run(&generator, &memory, 1000);
    if (generator.IsBusy() || generator.GetCompleted() != 50 ||
        generator.GetErrors() != 0) {
        CAMSIM_ERROR_PRINTF(
            "TestTrafficGenerator %s:%d completed %lu with %lu errors\n",
            __FILE__, __LINE__, generator.GetCompleted(),
            generator.GetErrors());
        return 1;
    }

    // The duplicated answers are caught.
    StutteringResponder responder;
    TrafficGenerator checked;
    yaml::Parser checkedParser;
    aliases.Insert("responder", &responder);
    if (checked.Configure(CreateFakeConfig(&checkedParser,
                                           "sendTo: *responder\n"
                                           "requests: 3\n"
                                           "ids: 1\n"
                                           "bufferSize: 0\n",
                                           &aliases))) {
        CAMSIM_ERROR_PRINTF("TestTrafficGenerator %s:%d configure failed\n",
                            __FILE__, __LINE__);
        return 1;
    }
    Run(&checked, &responder, 100);
    if (checked.GetCompleted() != 3 || checked.GetErrors() != 3) {
        CAMSIM_ERROR_PRINTF(
            "TestTrafficGenerator %s:%d completed %lu with %lu errors\n",
            __FILE__, __LINE__, checked.GetCompleted(), checked.GetErrors());
        return 1;
    }

    TrafficGenerator broken;
    yaml::Parser brokenParser;
    if (broken.Configure(CreateFakeConfig(&brokenParser,
                                          "sendTo: *memory\n"
                                          "pattern: zigzag\n",
                                          &aliases)) == 0) {
        CAMSIM_ERROR_PRINTF("TestTrafficGenerator %s:%d took a bad pattern\n",
                            __FILE__, __LINE__);
        return 1;
    }

    return 0;
}

#endif  // NDEBUG
