#include "minstrel/discord/channel_sink.hpp"

#include <ctime>

#include "minstrel/audio/track.hpp"

namespace minstrel::discord {

channel_sink::channel_sink(dpp::cluster& cluster)
    : m_cluster(cluster)
{
}

dpp::message channel_sink::render(audio::channel_id target, const audio::notice& message)
{
    if (message.kind != audio::notice_kind::now_playing || !message.subject) {
        return dpp::message(dpp::snowflake(target), message.text);
    }

    const audio::track_info& info = message.subject->info();
    std::string description = "Requested by: `" + info.requester + "`\n";
    description += info.is_stream ? "Duration: `live`"
                                  : "Duration: `" + audio::format_duration(info.duration) + "`";

    dpp::embed embed = dpp::embed()
        .set_color(0x0099ff)
        .set_author("Now Playing:", "", "")
        .set_title(info.title)
        .set_description(description)
        .set_timestamp(time(nullptr));
    if (!info.uri.empty()) {
        embed.set_url(info.uri);
    }

    dpp::message msg(dpp::snowflake(target), "");
    msg.add_embed(embed);
    return msg;
}

void channel_sink::send(audio::channel_id target, const audio::notice& message)
{
    if (target == 0) {
        return;
    }
    m_cluster.message_create(render(target, message), [this, target](const dpp::confirmation_callback_t& cb) {
        if (cb.is_error()) {
            m_cluster.log(dpp::ll_warning,
                          "Could not post to channel " + std::to_string(target) + ": " + cb.get_error().message);
        }
    });
}

} // namespace minstrel::discord
