#include "SessionOrchestrator.hpp"

#include "FakeChildTerminal.hpp"
#include "TestHeaders.hpp"

using namespace specter;

namespace {
class CapturingSink : public FrameSink {
 public:
  CapturingSink() : failing(false) {}

  virtual void emit(const Frame& frame) {
    lock_guard<std::mutex> guard(sinkMutex);
    if (failing) {
      throw IoError("Sink closed", EPIPE);
    }
    frames.push_back(frame);
  }

  vector<Frame> getFrames() {
    lock_guard<std::mutex> guard(sinkMutex);
    return frames;
  }

  bool hasFrame(FrameType type) {
    lock_guard<std::mutex> guard(sinkMutex);
    for (const auto& frame : frames) {
      if (frame.getType() == type) {
        return true;
      }
    }
    return false;
  }

  std::atomic<bool> failing;

 protected:
  std::mutex sinkMutex;
  vector<Frame> frames;
};

SessionOptions MakeOptions() {
  SessionOptions options;
  options.command = "fake-shell";
  options.idleTimeout = std::chrono::milliseconds(60000);
  return options;
}

void WriteString(int fd, const string& s) {
  FATAL_FAIL(::write(fd, s.data(), s.size()));
}
}  // namespace

TEST_CASE("Orchestrator delivers frames until the child exits",
          "[SessionOrchestrator]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  shared_ptr<PtySession> session(new PtySession(fake, MakeOptions()));
  shared_ptr<OutputProcessor> processor(new OutputProcessor(TokenMode::RAW));
  shared_ptr<CapturingSink> sink(new CapturingSink());
  shared_ptr<RecordingManager> recording(new RecordingManager());
  string path = MakeTempPath("specter_orchestrator");
  recording->startRecording(path, RecordingHeader());

  fake->finish("hello\n", 0);
  SessionOrchestrator orchestrator(session, processor, sink, recording, -1,
                                   true);
  orchestrator.run();

  auto frames = sink->getFrames();
  REQUIRE(frames.size() >= 2);
  REQUIRE(frames.front().getType() == FrameType::STDOUT);
  REQUIRE(frames.front().getData().value() == "hello\n");
  REQUIRE(frames.back().getType() == FrameType::EXIT);
  REQUIRE(frames.back().getCode().value() == 0);

  // The recording was finalized on shutdown.
  REQUIRE_FALSE(recording->isRecording());
  std::ifstream in(path);
  string header, event;
  REQUIRE(std::getline(in, header));
  REQUIRE(std::getline(in, event));
  json e = json::parse(event);
  REQUIRE(e[1] == "o");
  REQUIRE(e[2] == "hello\n");
  ::unlink(path.c_str());
}

TEST_CASE("Orchestrator handles JSON control input", "[SessionOrchestrator]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  shared_ptr<PtySession> session(new PtySession(fake, MakeOptions()));
  shared_ptr<OutputProcessor> processor(new OutputProcessor(TokenMode::RAW));
  shared_ptr<CapturingSink> sink(new CapturingSink());
  shared_ptr<RecordingManager> recording(new RecordingManager());

  int input[2];
  FATAL_FAIL(::pipe(input));
  SessionOrchestrator orchestrator(session, processor, sink, recording,
                                   input[0], true);
  std::thread loop([&orchestrator]() { orchestrator.run(); });

  WriteString(input[1], "{\"type\":\"stdin\",\"data\":\"ls\\n\"}\n");
  WriteString(input[1], "{\"type\":\"resize\",\"cols\":100,\"rows\":20}\n");
  WriteString(input[1], "this is not a frame\n");
  WriteString(input[1], "{\"type\":\"ping\"}\n");
  WriteString(input[1], "{\"type\":\"resize_ack\"}\n");
  WriteString(input[1],
              "{\"type\":\"stdin\",\"data\":\"AAE=\",\"binary\":true}\n");

  string expected("ls\n\x00\x01", 5);
  REQUIRE(WaitFor([&]() { return fake->getWritten() == expected; },
                  std::chrono::milliseconds(5000)));
  REQUIRE(WaitFor([&]() { return sink->hasFrame(FrameType::PONG); },
                  std::chrono::milliseconds(5000)));
  REQUIRE(WaitFor([&]() { return sink->hasFrame(FrameType::RESIZE); },
                  std::chrono::milliseconds(5000)));
  REQUIRE(fake->getResizes().size() == 1);
  REQUIRE(fake->getResizes()[0] == make_pair(uint16_t(100), uint16_t(20)));

  // End of input does not end the session.
  ::close(input[1]);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE_FALSE(session->isFinished());

  fake->finish("", 0);
  loop.join();
  REQUIRE(sink->hasFrame(FrameType::STDIN));
  REQUIRE(sink->getFrames().back().getType() == FrameType::EXIT);
  ::close(input[0]);
}

TEST_CASE("Orchestrator forwards raw input", "[SessionOrchestrator]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  shared_ptr<PtySession> session(new PtySession(fake, MakeOptions()));
  shared_ptr<OutputProcessor> processor(new OutputProcessor(TokenMode::RAW));
  shared_ptr<CapturingSink> sink(new CapturingSink());

  int input[2];
  FATAL_FAIL(::pipe(input));
  SessionOrchestrator orchestrator(session, processor, sink,
                                   shared_ptr<RecordingManager>(), input[0],
                                   false);
  std::thread loop([&orchestrator]() { orchestrator.run(); });

  WriteString(input[1], "{\"type\":\"ping\"}\n");
  REQUIRE(WaitFor(
      [&]() { return fake->getWritten() == "{\"type\":\"ping\"}\n"; },
      std::chrono::milliseconds(5000)));
  REQUIRE_FALSE(sink->hasFrame(FrameType::PONG));

  fake->finish("", 0);
  loop.join();
  ::close(input[0]);
  ::close(input[1]);
}

TEST_CASE("Orchestrator shuts down on request and flushes",
          "[SessionOrchestrator]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  shared_ptr<PtySession> session(new PtySession(fake, MakeOptions()));
  shared_ptr<OutputProcessor> processor(
      new OutputProcessor(TokenMode::COMPACT));
  shared_ptr<CapturingSink> sink(new CapturingSink());
  SessionOrchestrator orchestrator(session, processor, sink,
                                   shared_ptr<RecordingManager>(), -1, true);
  std::thread loop([&orchestrator]() { orchestrator.run(); });

  fake->pushOutput("partial line");
  auto channel = session->getFrameChannel();
  REQUIRE(WaitFor([&]() { return !fake->hasPendingOutput(); },
                  std::chrono::milliseconds(5000)));
  // Give the reader time to hand the chunk to the channel.
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(WaitFor([&]() { return channel->size() == 0; },
                  std::chrono::milliseconds(5000)));

  orchestrator.requestShutdown();
  loop.join();
  REQUIRE_FALSE(session->isFinished());
  auto frames = sink->getFrames();
  REQUIRE(frames.size() == 1);
  REQUIRE(frames[0].getType() == FrameType::STDOUT);
  REQUIRE(frames[0].getData().value() == "partial line");

  fake->closeOutput();
}

TEST_CASE("Orchestrator stops when the sink fails", "[SessionOrchestrator]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  shared_ptr<PtySession> session(new PtySession(fake, MakeOptions()));
  shared_ptr<OutputProcessor> processor(new OutputProcessor(TokenMode::RAW));
  shared_ptr<CapturingSink> sink(new CapturingSink());
  sink->failing = true;
  SessionOrchestrator orchestrator(session, processor, sink,
                                   shared_ptr<RecordingManager>(), -1, true);

  fake->pushOutput("nobody is listening\n");
  orchestrator.run();
  REQUIRE(sink->getFrames().empty());
  REQUIRE_FALSE(session->isFinished());
  fake->closeOutput();
}
