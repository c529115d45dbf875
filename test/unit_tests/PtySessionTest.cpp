#include "PtySession.hpp"

#include "FakeChildTerminal.hpp"
#include "TestHeaders.hpp"

using namespace specter;

namespace {
SessionOptions MakeOptions() {
  SessionOptions options;
  options.command = "fake-shell";
  options.args = {"-i"};
  options.cols = 100;
  options.rows = 30;
  options.idleTimeout = std::chrono::milliseconds(200);
  return options;
}

vector<Frame> DrainChannel(shared_ptr<FrameChannel> channel) {
  vector<Frame> frames;
  Frame frame(FrameType::PING, 0);
  while (channel->pop(&frame)) {
    frames.push_back(frame);
  }
  return frames;
}

Frame NextFrame(shared_ptr<FrameChannel> channel) {
  Frame frame(FrameType::PING, 0);
  REQUIRE(channel->waitPop(&frame, std::chrono::milliseconds(5000)));
  return frame;
}
}  // namespace

TEST_CASE("PtySession rejects invalid options before spawning",
          "[PtySession]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  SessionOptions options = MakeOptions();

  SECTION("Zero columns") { options.cols = 0; }
  SECTION("Zero rows") { options.rows = 0; }
  SECTION("Zero idle timeout") {
    options.idleTimeout = std::chrono::milliseconds(0);
  }
  SECTION("Zero buffer budget") { options.maxBufferedBytes = 0; }
  SECTION("No command") { options.command = ""; }
  SECTION("Invalid prompt pattern") { options.promptPatterns = {"(broken"}; }

  REQUIRE_THROWS_AS(PtySession(fake, options), ConfigurationError);
  REQUIRE_FALSE(fake->spawned);
}

TEST_CASE("PtySession spawns with the configured geometry", "[PtySession]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  PtySession session(fake, MakeOptions());
  REQUIRE(fake->spawned);
  REQUIRE(fake->spawnedCommand == "fake-shell");
  REQUIRE(fake->spawnedArgs == vector<string>({"-i"}));
  REQUIRE(fake->getWindowSize().ws_col == 100);
  REQUIRE(fake->getWindowSize().ws_row == 30);
  REQUIRE(session.isAlive());
  REQUIRE_FALSE(session.isFinished());
}

TEST_CASE("PtySession surfaces spawn failures", "[PtySession]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  fake->failSpawn = true;
  REQUIRE_THROWS_AS(PtySession(fake, MakeOptions()), SpawnError);
}

TEST_CASE("PtySession turns output into stdout frames", "[PtySession]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  PtySession session(fake, MakeOptions());
  session.startReader();

  fake->pushOutput("hello ");
  fake->pushOutput("world\n");
  string received;
  while (received.size() < 12) {
    Frame frame = NextFrame(session.getFrameChannel());
    REQUIRE(frame.getType() == FrameType::STDOUT);
    received += frame.getData().value();
  }
  REQUIRE(received == "hello world\n");

  SECTION("Split characters are reassembled") {
    fake->pushOutput("\xE2\x82");
    fake->pushOutput("\xAC\n");
    Frame frame = NextFrame(session.getFrameChannel());
    REQUIRE(frame.getData().value() == "\xE2\x82\xAC\n");
  }

  fake->closeOutput();
}

TEST_CASE("PtySession idle detection is edge triggered", "[PtySession]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  PtySession session(fake, MakeOptions());
  auto channel = session.getFrameChannel();
  auto start = std::chrono::steady_clock::now();

  session.tick(start + std::chrono::milliseconds(300));
  auto frames = DrainChannel(channel);
  REQUIRE(frames.size() == 1);
  REQUIRE(frames[0].getType() == FrameType::IDLE);
  REQUIRE(frames[0].getDurationMs().value() >= 200);

  // Still idle, but already reported.
  session.tick(start + std::chrono::milliseconds(600));
  session.tick(start + std::chrono::milliseconds(900));
  REQUIRE(DrainChannel(channel).empty());

  // Activity re-arms the detector.
  session.writeInput("x");
  auto afterInput = std::chrono::steady_clock::now();
  frames = DrainChannel(channel);
  REQUIRE(frames.size() == 1);
  REQUIRE(frames[0].getType() == FrameType::STDIN);

  session.tick(afterInput + std::chrono::milliseconds(50));
  REQUIRE(DrainChannel(channel).empty());
  session.tick(afterInput + std::chrono::milliseconds(250));
  frames = DrainChannel(channel);
  REQUIRE(frames.size() == 1);
  REQUIRE(frames[0].getType() == FrameType::IDLE);
}

TEST_CASE("PtySession reports the exit code after trailing output",
          "[PtySession]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  PtySession session(fake, MakeOptions());
  session.startReader();
  fake->finish("bye\n", 3);

  session.tick(std::chrono::steady_clock::now());
  REQUIRE(session.isFinished());
  REQUIRE_FALSE(session.isAlive());

  auto frames = DrainChannel(session.getFrameChannel());
  REQUIRE(frames.size() == 2);
  REQUIRE(frames[0].getType() == FrameType::STDOUT);
  REQUIRE(frames[0].getData().value() == "bye\n");
  REQUIRE(frames[1].getType() == FrameType::EXIT);
  REQUIRE(frames[1].getCode().value() == 3);
  REQUIRE(session.getFrameChannel()->isDrained());
}

TEST_CASE("PtySession reports a fatal signal by name", "[PtySession]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  PtySession session(fake, MakeOptions());
  fake->closeOutput();
  fake->pushStatus(ChildStatus::SIGNALED, SIGKILL);
  session.startReader();

  session.tick(std::chrono::steady_clock::now());
  auto frames = DrainChannel(session.getFrameChannel());
  REQUIRE(frames.size() == 1);
  REQUIRE(frames[0].getType() == FrameType::SIGNAL);
  REQUIRE(frames[0].getSignal().value() == "SIGKILL");
  REQUIRE_FALSE(frames[0].getCode());
  REQUIRE(session.isFinished());
}

TEST_CASE("PtySession reports stop and continue", "[PtySession]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  SessionOptions options = MakeOptions();
  options.idleTimeout = std::chrono::milliseconds(60000);
  PtySession session(fake, options);
  auto start = std::chrono::steady_clock::now();

  fake->pushStatus(ChildStatus::STOPPED, SIGTSTP);
  session.tick(start);
  fake->pushStatus(ChildStatus::CONTINUED, SIGCONT);
  session.tick(start + std::chrono::milliseconds(LIVENESS_POLL_INTERVAL_MS));

  auto frames = DrainChannel(session.getFrameChannel());
  REQUIRE(frames.size() == 2);
  REQUIRE(frames[0].getType() == FrameType::STOPPED);
  REQUIRE(frames[0].getSignal().value() == "SIGTSTP");
  REQUIRE(frames[1].getType() == FrameType::CONTINUED);
  REQUIRE(session.isAlive());
  REQUIRE_FALSE(session.isFinished());
}

TEST_CASE("PtySession enforces the buffer budget", "[PtySession]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  SessionOptions options = MakeOptions();
  options.idleTimeout = std::chrono::milliseconds(60000);
  options.maxBufferedBytes = 10;
  options.overflowGrace = std::chrono::milliseconds(1000);
  PtySession session(fake, options);
  auto channel = session.getFrameChannel();
  auto start = std::chrono::steady_clock::now();

  // An undrained backlog the consumer never picks up.
  channel->push(Frame(FrameType::STDOUT).withData(string(20, 'z')));

  session.tick(start);
  Frame frame(FrameType::PING, 0);
  REQUIRE(channel->pop(&frame));
  REQUIRE(frame.getType() == FrameType::STDOUT);
  REQUIRE(channel->pop(&frame));
  REQUIRE(frame.getType() == FrameType::OVERFLOW);
  REQUIRE_THAT(frame.getReason().value(),
               Catch::Matchers::ContainsSubstring("limit is 10"));

  SECTION("Draining the backlog avoids the kill") {
    session.tick(start + std::chrono::milliseconds(1500));
    REQUIRE(fake->getKillCount() == 0);
    REQUIRE(DrainChannel(channel).empty());
  }

  SECTION("A stalled consumer gets the child killed") {
    channel->push(Frame(FrameType::STDOUT).withData(string(20, 'z')));
    session.tick(start + std::chrono::milliseconds(500));
    REQUIRE(fake->getKillCount() == 0);

    session.tick(start + std::chrono::milliseconds(1000));
    REQUIRE(fake->getKillCount() == 1);
    auto frames = DrainChannel(channel);
    REQUIRE(frames.size() == 2);
    REQUIRE(frames[1].getType() == FrameType::CAPSULE_KILL);
    REQUIRE(frames[1].getReason());

    session.tick(start + std::chrono::milliseconds(2000));
    REQUIRE(fake->getKillCount() == 1);
  }
}

TEST_CASE("PtySession input and resize", "[PtySession]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  PtySession session(fake, MakeOptions());
  auto channel = session.getFrameChannel();

  SECTION("Input is written verbatim and mirrored") {
    session.writeInput("echo hi\r");
    REQUIRE(fake->getWritten() == "echo hi\r");
    auto frames = DrainChannel(channel);
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].getType() == FrameType::STDIN);
    REQUIRE(frames[0].getData().value() == "echo hi\r");
  }

  SECTION("Input that is not UTF-8 is mirrored as binary") {
    string bytes("\x1b\xff\x03", 3);
    session.writeInput(bytes);
    REQUIRE(fake->getWritten() == bytes);
    auto frames = DrainChannel(channel);
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].getType() == FrameType::STDIN);
    REQUIRE(frames[0].isBinary());
    REQUIRE(frames[0].getBinaryData() == bytes);
  }

  SECTION("Failed writes raise and emit nothing") {
    fake->failWrites = true;
    REQUIRE_THROWS_AS(session.writeInput("x"), IoError);
    REQUIRE(DrainChannel(channel).empty());
  }

  SECTION("Resize updates the terminal and emits a frame") {
    session.resize(200, 50);
    REQUIRE(fake->getResizes().size() == 1);
    REQUIRE(fake->getWindowSize().ws_col == 200);
    REQUIRE(fake->getWindowSize().ws_row == 50);
    auto frames = DrainChannel(channel);
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].getType() == FrameType::RESIZE);
    REQUIRE(frames[0].getCols().value() == 200);
    REQUIRE(frames[0].getRows().value() == 50);
  }

  SECTION("Zero sizes are rejected") {
    REQUIRE_THROWS_AS(session.resize(0, 50), IoError);
    REQUIRE(fake->getResizes().empty());
    REQUIRE(DrainChannel(channel).empty());
  }
}

TEST_CASE("PtySession schedules its next wakeup", "[PtySession]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  PtySession session(fake, MakeOptions());
  auto now = std::chrono::steady_clock::now();
  auto wakeup = session.nextWakeup(now);
  REQUIRE(wakeup >= now);
  REQUIRE(wakeup <= now + std::chrono::milliseconds(200));
}

TEST_CASE("PtySession run supervises until exit", "[PtySession]") {
  shared_ptr<FakeChildTerminal> fake(new FakeChildTerminal());
  shared_ptr<PtySession> session(new PtySession(fake, MakeOptions()));
  std::thread supervisor([session]() { session->run(); });

  SECTION("Child exit ends the run") {
    fake->finish("done\n", 0);
    supervisor.join();
    REQUIRE(session->isFinished());
    auto frames = DrainChannel(session->getFrameChannel());
    REQUIRE_FALSE(frames.empty());
    REQUIRE(frames.back().getType() == FrameType::EXIT);
    REQUIRE(frames.back().getCode().value() == 0);
  }

  SECTION("Cancel stops supervision") {
    session->cancel();
    supervisor.join();
    REQUIRE_FALSE(session->isFinished());
    fake->closeOutput();
  }
}
