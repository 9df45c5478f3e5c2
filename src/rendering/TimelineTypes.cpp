#include "TimelineTypes.h"

namespace TimelineTypes
{
    namespace
    {
        struct TransitionNameVisitor
        {
            juce::String operator()(const NoTransition&) const        { return "none"; }
            juce::String operator()(const FadeTransition&) const      { return "fade"; }
            juce::String operator()(const CrossfadeTransition&) const { return "crossfade"; }
        };
    }

    bool parseTransition(const juce::String& name, Transition& result)
    {
        const juce::String key = name.trim().toLowerCase();

        if (key == "none")
            result = NoTransition{};
        else if (key == "fade")
            result = FadeTransition{};
        else if (key == "crossfade")
            result = CrossfadeTransition{};
        else
            return false;

        return true;
    }

    juce::String transitionName(const Transition& transition)
    {
        return std::visit(TransitionNameVisitor{}, transition);
    }

    bool parseQuoteStyle(const juce::String& name, QuoteStyle& result)
    {
        const juce::String key = name.trim().toLowerCase();

        if (key == "minimal")
            result = QuoteStyle::Minimal;
        else if (key == "centered")
            result = QuoteStyle::Centered;
        else if (key == "top")
            result = QuoteStyle::Top;
        else if (key == "bottom")
            result = QuoteStyle::Bottom;
        else
            return false;

        return true;
    }

    juce::String quoteStyleName(QuoteStyle style)
    {
        switch (style)
        {
            case QuoteStyle::Minimal:  return "minimal";
            case QuoteStyle::Centered: return "centered";
            case QuoteStyle::Top:      return "top";
            case QuoteStyle::Bottom:   return "bottom";
        }

        return "centered";
    }

    juce::String formatNumber(double value)
    {
        juce::String text(value, 3);

        if (text.containsChar('.'))
            text = text.trimCharactersAtEnd("0").trimCharactersAtEnd(".");

        return text == "-0" ? juce::String("0") : text;
    }
}
