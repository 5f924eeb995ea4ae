
#include "common.h"
#include "config.h"
#include "sound.h"
#include "auditory.h"
#include "vocal_tract.h"
#include "phones.h"
#include "args.h"

const char * g_default_phones = "data/english.phones";
const char * g_default_dict = "data/english.dict";

ConfigParser load_config (const char * filename)
{
  return filename ? ConfigParser(filename) : ConfigParser();
}

//----( analysis )------------------------------------------------------------

void run_analyze (Args & args)
{
  const char * sound_filename = args.pop();
  const char * config_filename = args.pop((const char *) NULL);

  Auditory::Config config;
  config.load(load_config(config_filename));

  // raw files hold every channel the config may select
  const size_t channels = config.input.channels == 1
                        ? config.input.channel + 1
                        : config.input.channels;
  Sound sound(config.input.sample_rate, channels);
  ASSERT(sound.load_raw(sound_filename), "failed to load " << sound_filename);

  Timer timer;
  FeatureTable table;
  Auditory::AuditoryProc proc(config);
  proc.set_sink(& table);

  if (not proc.load_sound(sound)) {
    WARN("nothing to analyze in " << sound_filename);
    return;
  }
  while (proc.input_steps_left()) {
    if (not proc.process_trial()) break;
  }

  LOG("analyzed " << proc.rows() << " trials of "
      << proc.input().trial_steps << " steps in " << timer.elapsed() << " sec");
  table.write(cout);
}

//----( synthesis )-----------------------------------------------------------

Trm::VocalTract * new_vocal_tract (const ConfigParser & config)
{
  Trm::TubeConfig tube;
  tube.load(config);
  Trm::VoiceParams voice;
  voice.load(config);
  Trm::SynthSpec synth;
  synth.load(config);

  return new Trm::VocalTract(tube, voice, synth);
}

void save_output (const Trm::VocalTract & tract, const char * filename)
{
  Sound sound(tract.synth().output_rate, 1);
  tract.write_output(sound);
  ASSERT(sound.save_raw(filename), "failed to save " << filename);

  LOG("wrote " << sound.duration() << " sec at " << sound.sample_rate()
      << " Hz, peak = " << tract.max_sample());
}

void run_synth (Args & args)
{
  const string phones = args.pop();
  const char * out_filename = args.pop();
  const char * config_filename = args.pop((const char *) NULL);

  const ConfigParser config = load_config(config_filename);
  const string phone_filename = args.pop(
      config("phones.table", g_default_phones).c_str());

  Trm::PhoneTable table(phone_filename.c_str());
  Trm::VocalTract * tract = new_vocal_tract(config);
  Trm::PhoneSequencer sequencer(* tract, table);

  bool said = sequencer.synth_phones(phones);
  if (said) {
    tract->flush();
    save_output(* tract, out_filename);
  }

  delete tract;
  ASSERT(said, "failed to synthesize " << phones);
}

void run_say (Args & args)
{
  const string words = args.pop();
  const char * out_filename = args.pop();
  const char * config_filename = args.pop((const char *) NULL);

  const ConfigParser config = load_config(config_filename);
  const string phone_filename = args.pop(
      config("phones.table", g_default_phones).c_str());
  const string dict_filename = args.pop(
      config("phones.dict", g_default_dict).c_str());

  Trm::PhoneTable table(phone_filename.c_str());
  Trm::Dictionary dict(dict_filename.c_str());
  Trm::VocalTract * tract = new_vocal_tract(config);
  Trm::PhoneSequencer sequencer(* tract, table, & dict);

  bool said = sequencer.synth_words(words);
  if (said) {
    tract->flush();
    save_output(* tract, out_filename);
  }

  delete tract;
  ASSERT(said, "failed to say " << words);
}

//----( main )----------------------------------------------------------------

const char * help_message =
"Usage: larynx COMMAND [ARGS]"
"\nCommands:"
"\n  analyze SOUND.raw [CONFIG]"
"\n    prints auditory features of a raw float32 sound"
"\n  synth PHONES OUT.raw [CONFIG] [PHONE_TABLE]"
"\n    synthesizes a phone string, eg \"h_uh.l_'aw\""
"\n  say WORDS OUT.raw [CONFIG] [PHONE_TABLE] [DICTIONARY]"
"\n    synthesizes quoted words from the dictionary"
"\n  help"
"\nSee config/default.auditory.conf and config/default.vocal.conf for options."
;

void run_help (Args & args) { LOG(help_message); }

int main (int argc, char ** argv)
{
  LOG(larynx_logo);

  Args args(argc, argv, help_message);

  args
    .case_("analyze", run_analyze)
    .case_("synth", run_synth)
    .case_("say", run_say)
    .case_("help", run_help)
    .default_error();

  return 0;
}

